#include "demo/camera/CameraRig.hpp"

#include <algorithm>
#include <optional>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/trigonometric.hpp>

#include "demo/character/Character.hpp"
#include "demo/character/Controls.hpp"
#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"

namespace demo::camera
{
glm::mat4 CameraPose::ViewMatrix() const
{
    const glm::vec3 up = rotation * glm::vec3{0.0F, 1.0F, 0.0F};
    return glm::lookAt(position, position + Forward(), up);
}

void CameraRig::SetDistance(float distance)
{
    m_distance = std::clamp(distance, kCameraMinDistance, kCameraMaxDistance);
}

void CameraRig::ApplyZoom(float delta)
{
    SetDistance(m_distance + delta);
}

glm::mat4 CameraRig::ProjectionMatrix(float aspectRatio) const
{
    return glm::perspective(glm::radians(m_fovDegrees), std::max(aspectRatio, 0.01F), m_nearClip, m_farClip);
}

void CameraRig::Update(
    engine::scene::World& world,
    const engine::physics::PhysicsWorld& physics,
    engine::scene::Entity character,
    const character::Controls& controls
)
{
    const engine::scene::Transform* transform = world.FindTransform(character);
    if (transform == nullptr)
    {
        return;
    }

    const glm::quat rotation = transform->rotation;
    const glm::quat look = rotation * glm::angleAxis(glm::radians(-controls.pitch), glm::vec3{1.0F, 0.0F, 0.0F});

    // Head follows the look pitch within a natural range.
    glm::vec3 headWorldPosition = transform->position + rotation * (glm::vec3{0.0F, 1.6F, 0.0F} * transform->scale);
    auto model = world.AnimatedModels().find(character);
    if (model != world.AnimatedModels().end())
    {
        engine::scene::Bone* head = model->second.FindBone(character::Character::kHeadBone);
        if (head != nullptr)
        {
            const float limitPitch = std::clamp(controls.pitch, -kHeadPitchLimit, kHeadPitchLimit);
            head->localRotation = glm::angleAxis(glm::radians(-limitPitch), glm::vec3{1.0F, 0.0F, 0.0F});
            headWorldPosition = transform->position + rotation * (head->localPosition * transform->scale);
        }
    }

    if (m_firstPerson)
    {
        m_pose.position = headWorldPosition + rotation * glm::vec3{0.0F, 0.15F, -0.2F};
        m_pose.rotation = look;
        return;
    }

    const glm::vec3 aimPoint = transform->position + rotation * glm::vec3{0.0F, 1.7F, 0.0F};
    const glm::vec3 rayDir = look * glm::vec3{0.0F, 0.0F, 1.0F};
    float rayDistance = m_distance;

    const std::optional<engine::physics::RaycastHit> hit =
        physics.RaycastSingle(engine::physics::Ray{aimPoint, rayDir}, rayDistance, kCameraCollisionMask);
    if (hit.has_value())
    {
        rayDistance = std::min(rayDistance, hit->distance);
    }
    rayDistance = std::clamp(rayDistance, kCameraMinDistance, kCameraMaxDistance);

    m_effectiveDistance = rayDistance;
    m_pose.position = aimPoint + rayDir * rayDistance;
    m_pose.rotation = look;
}
} // namespace demo::camera
