#pragma once

#include <cstdint>

#include <glm/gtc/quaternion.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include "engine/scene/Components.hpp"

namespace engine::physics
{
class PhysicsWorld;
}

namespace engine::scene
{
class World;
}

namespace demo::character
{
struct Controls;
}

namespace demo::camera
{
constexpr float kCameraMinDistance = 1.0F;
constexpr float kCameraInitialDistance = 5.0F;
constexpr float kCameraMaxDistance = 20.0F;
constexpr float kHeadPitchLimit = 45.0F;
// Static scene geometry.
constexpr std::uint32_t kCameraCollisionMask = 2U;

struct CameraPose
{
    glm::vec3 position{0.0F, 2.0F, 5.0F};
    glm::quat rotation{1.0F, 0.0F, 0.0F, 0.0F};

    [[nodiscard]] glm::vec3 Forward() const { return rotation * glm::vec3{0.0F, 0.0F, -1.0F}; }
    [[nodiscard]] glm::mat4 ViewMatrix() const;
};

/// Follows the character in first or third person. The third person camera
/// is pulled in front of geometry between it and the aim point.
class CameraRig
{
public:
    void Update(
        engine::scene::World& world,
        const engine::physics::PhysicsWorld& physics,
        engine::scene::Entity character,
        const character::Controls& controls
    );

    void SetFirstPerson(bool firstPerson) { m_firstPerson = firstPerson; }
    void ToggleFirstPerson() { m_firstPerson = !m_firstPerson; }
    [[nodiscard]] bool IsFirstPerson() const { return m_firstPerson; }

    void SetDistance(float distance);
    void ApplyZoom(float delta);
    /// Desired third person distance.
    [[nodiscard]] float Distance() const { return m_distance; }
    /// Distance used last update after collision.
    [[nodiscard]] float EffectiveDistance() const { return m_effectiveDistance; }

    void SetFarClip(float farClip) { m_farClip = farClip; }
    [[nodiscard]] float FarClip() const { return m_farClip; }
    [[nodiscard]] float FovDegrees() const { return m_fovDegrees; }
    [[nodiscard]] glm::mat4 ProjectionMatrix(float aspectRatio) const;

    [[nodiscard]] const CameraPose& Pose() const { return m_pose; }

private:
    CameraPose m_pose{};
    bool m_firstPerson = false;
    float m_distance = kCameraInitialDistance;
    float m_effectiveDistance = kCameraInitialDistance;
    float m_fovDegrees = 45.0F;
    float m_nearClip = 0.1F;
    float m_farClip = 1000.0F;
};
} // namespace demo::camera
