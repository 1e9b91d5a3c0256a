#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/scene/Components.hpp"

namespace engine::scene
{
class World;
}

namespace engine::physics
{
struct Ray
{
    glm::vec3 origin{0.0F};
    glm::vec3 direction{0.0F, 0.0F, -1.0F};
};

struct RaycastHit
{
    engine::scene::Entity entity = 0;
    float distance = 0.0F;
    glm::vec3 position{0.0F};
    glm::vec3 normal{0.0F, 1.0F, 0.0F};
};

struct ContactPoint
{
    glm::vec3 position{0.0F};
    // Points toward the body receiving the event.
    glm::vec3 normal{0.0F, 1.0F, 0.0F};
    float distance = 0.0F;
    float impulse = 0.0F;
};

struct CollisionEvent
{
    engine::scene::Entity body = 0;
    engine::scene::Entity other = 0;
    std::vector<ContactPoint> contacts;
};

/// Local-space box used to approximate a static mesh for collision.
struct CollisionPart
{
    glm::vec3 center{0.0F};
    glm::vec3 halfExtents{0.5F};
};

/// Impulse-based rigid body simulation over the bodies stored in a scene::World.
/// Static bodies (mass 0) are indexed once; dynamic bodies are integrated each step.
class PhysicsWorld
{
public:
    using PreStepHandler = std::function<void(float)>;
    using CollisionHandler = std::function<void(const CollisionEvent&)>;

    explicit PhysicsWorld(engine::scene::World& world);

    void SetGravity(const glm::vec3& gravity) { m_gravity = gravity; }
    [[nodiscard]] const glm::vec3& Gravity() const { return m_gravity; }

    void RegisterMeshParts(const std::string& model, std::vector<CollisionPart> parts);
    /// Static geometry is cached; call after adding or moving static bodies.
    void MarkStaticsDirty() { m_staticsDirty = true; }

    std::size_t SubscribePreStep(PreStepHandler handler);
    void UnsubscribePreStep(std::size_t token);
    std::size_t SubscribeCollision(engine::scene::Entity entity, CollisionHandler handler);
    void UnsubscribeCollision(std::size_t token);

    void Step(float timeStep);

    void ApplyImpulse(engine::scene::Entity entity, const glm::vec3& impulse);
    [[nodiscard]] glm::vec3 LinearVelocity(engine::scene::Entity entity) const;
    void SetLinearVelocity(engine::scene::Entity entity, const glm::vec3& velocity);

    /// Nearest hit along the ray within maxDistance against bodies whose
    /// collision layer intersects layerMask. Rays starting inside a body ignore it.
    [[nodiscard]] std::optional<RaycastHit> RaycastSingle(const Ray& ray, float maxDistance, std::uint32_t layerMask) const;

    [[nodiscard]] std::size_t StaticSolidCount() const;
    [[nodiscard]] std::size_t DynamicBodyCount() const;
    [[nodiscard]] std::uint64_t StepCount() const { return m_stepCount; }

private:
    struct StaticSolid
    {
        engine::scene::Entity entity = 0;
        glm::vec3 minBounds{0.0F};
        glm::vec3 maxBounds{0.0F};
        std::uint32_t layer = 1;
        std::uint32_t mask = 0xFFFFU;
        float friction = 0.5F;
    };

    struct DynamicProxy
    {
        engine::scene::Entity entity = 0;
        bool capsule = false;
        glm::vec3 center{0.0F};
        glm::vec3 halfExtents{0.5F};
        float radius = 0.5F;
        float halfSegment = 0.0F;
    };

    struct CellKey
    {
        int x = 0;
        int y = 0;
        int z = 0;

        [[nodiscard]] bool operator==(const CellKey& other) const
        {
            return x == other.x && y == other.y && z == other.z;
        }
    };

    struct CellKeyHash
    {
        [[nodiscard]] std::size_t operator()(const CellKey& key) const
        {
            const std::size_t hx = static_cast<std::size_t>(key.x) * 73856093U;
            const std::size_t hy = static_cast<std::size_t>(key.y) * 19349663U;
            const std::size_t hz = static_cast<std::size_t>(key.z) * 83492791U;
            return hx ^ hy ^ hz;
        }
    };

    struct PreStepSubscriber
    {
        std::size_t token = 0;
        PreStepHandler handler;
    };

    struct CollisionSubscriber
    {
        std::size_t token = 0;
        engine::scene::Entity entity = 0;
        CollisionHandler handler;
    };

    void RebuildStatics() const;
    void AppendStaticCandidates(const glm::vec3& minBounds, const glm::vec3& maxBounds, std::vector<std::size_t>& outIndices) const;
    [[nodiscard]] DynamicProxy BuildProxy(engine::scene::Entity entity) const;
    [[nodiscard]] bool ResolveAgainstStatic(DynamicProxy& proxy, const StaticSolid& solid, ContactPoint* outContact) const;
    void ResolveDynamicPair(DynamicProxy& a, DynamicProxy& b);
    void RecordContact(engine::scene::Entity body, engine::scene::Entity other, const ContactPoint& contact);
    void DispatchCollisions();

    static bool SphereIntersectsExpandedAabb(
        const glm::vec3& center,
        float radius,
        const glm::vec3& minBounds,
        const glm::vec3& maxBounds,
        float halfSegment,
        glm::vec3* outNormal,
        float* outPenetration
    );

    static bool SegmentIntersectsAabb(
        const glm::vec3& from,
        const glm::vec3& to,
        const glm::vec3& minBounds,
        const glm::vec3& maxBounds,
        float* outT,
        glm::vec3* outNormal
    );

    static bool AabbOverlap(
        const glm::vec3& centerA,
        const glm::vec3& halfA,
        const glm::vec3& centerB,
        const glm::vec3& halfB,
        glm::vec3* outNormal,
        float* outPenetration
    );

    engine::scene::World& m_world;
    glm::vec3 m_gravity{0.0F, -9.81F, 0.0F};
    std::unordered_map<std::string, std::vector<CollisionPart>> m_meshParts;

    std::vector<PreStepSubscriber> m_preStepSubscribers;
    std::vector<CollisionSubscriber> m_collisionSubscribers;
    std::size_t m_nextToken = 1;

    std::vector<CollisionEvent> m_pendingEvents;
    std::uint64_t m_stepCount = 0;

    mutable std::vector<StaticSolid> m_statics;
    mutable std::unordered_map<CellKey, std::vector<std::size_t>, CellKeyHash> m_cells;
    mutable std::vector<std::size_t> m_scratch;
    mutable std::vector<std::uint32_t> m_visitStamp;
    mutable std::uint32_t m_currentStamp = 1;
    mutable bool m_staticsDirty = true;
    float m_cellSize = 8.0F;
};
} // namespace engine::physics
