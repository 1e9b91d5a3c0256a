#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>

namespace engine::scene
{
using Entity = std::uint32_t;
constexpr Entity kInvalidEntity = 0;

struct Transform
{
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    glm::quat rotation{1.0F, 0.0F, 0.0F, 0.0F};
    glm::vec3 scale{1.0F, 1.0F, 1.0F};
};

struct NameComponent
{
    std::string name;
};

enum class ShapeType
{
    Box,
    Capsule,
    // Static geometry collided against as the union of the model's collision parts.
    StaticMesh
};

struct CollisionShape
{
    ShapeType type = ShapeType::Box;
    // Box: full extents. Capsule: x = diameter, y = total height.
    glm::vec3 size{1.0F, 1.0F, 1.0F};
    glm::vec3 offset{0.0F, 0.0F, 0.0F};
    std::string model;
};

enum class CollisionEventMode
{
    Never,
    WhenActive,
    Always
};

struct RigidBody
{
    float mass = 0.0F;
    glm::vec3 linearVelocity{0.0F, 0.0F, 0.0F};
    // Per-axis rotation response. PhysicsWorld integrates linear motion only,
    // so contacts never rotate a body; the factor is kept for snapshots.
    glm::vec3 angularFactor{1.0F, 1.0F, 1.0F};
    float friction = 0.5F;
    std::uint32_t collisionLayer = 1;
    std::uint32_t collisionMask = 0xFFFFU;
    CollisionEventMode collisionEvents = CollisionEventMode::WhenActive;

    [[nodiscard]] bool IsDynamic() const { return mass > 0.0F; }
};

struct Renderable
{
    std::string model;
    glm::vec3 color{0.8F, 0.8F, 0.8F};
    bool castShadows = false;
};

struct Bone
{
    std::string name;
    // Relative to the owning node, in node space.
    glm::vec3 localPosition{0.0F, 0.0F, 0.0F};
    glm::quat localRotation{1.0F, 0.0F, 0.0F, 0.0F};
    bool animated = true;
};

struct AnimatedModel
{
    std::string model;
    std::vector<Bone> bones;

    [[nodiscard]] Bone* FindBone(const std::string& name)
    {
        for (Bone& bone : bones)
        {
            if (bone.name == name)
            {
                return &bone;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const Bone* FindBone(const std::string& name) const
    {
        for (const Bone& bone : bones)
        {
            if (bone.name == name)
            {
                return &bone;
            }
        }
        return nullptr;
    }
};

struct DirectionalLight
{
    glm::vec3 direction{0.0F, -1.0F, 0.0F};
    glm::vec3 color{1.0F, 1.0F, 1.0F};
    float brightness = 1.0F;
    bool castShadows = false;
};

struct Zone
{
    glm::vec3 ambientColor{0.15F, 0.15F, 0.15F};
    glm::vec3 fogColor{0.5F, 0.5F, 0.7F};
    float fogStart = 100.0F;
    float fogEnd = 300.0F;
    glm::vec3 boundsMin{-1000.0F, -1000.0F, -1000.0F};
    glm::vec3 boundsMax{1000.0F, 1000.0F, 1000.0F};
};
} // namespace engine::scene
