#include "demo/character/Character.hpp"

#include <cmath>

#include <glm/geometric.hpp>

namespace demo::character
{
const char* CharacterStateToText(CharacterState state)
{
    switch (state)
    {
        case CharacterState::Airborne: return "Airborne";
        case CharacterState::Grounded: return "Grounded";
        case CharacterState::JumpPrimed: return "JumpPrimed";
        default: return "Unknown";
    }
}

Character::Character(
    engine::scene::World& world,
    engine::physics::PhysicsWorld& physics,
    engine::scene::Entity entity,
    CharacterTuning tuning
)
    : m_world(world)
    , m_physics(physics)
    , m_entity(entity)
    , m_tuning(tuning)
{
}

Character::~Character()
{
    Detach();
}

void Character::Attach()
{
    if (IsAttached())
    {
        return;
    }

    m_preStepToken = m_physics.SubscribePreStep([this](float timeStep) { FixedUpdate(timeStep); });
    m_collisionToken = m_physics.SubscribeCollision(m_entity, [this](const engine::physics::CollisionEvent& event) {
        HandleNodeCollision(event);
    });
}

void Character::Detach()
{
    if (m_preStepToken != 0)
    {
        m_physics.UnsubscribePreStep(m_preStepToken);
        m_preStepToken = 0;
    }
    if (m_collisionToken != 0)
    {
        m_physics.UnsubscribeCollision(m_collisionToken);
        m_collisionToken = 0;
    }
}

void Character::FixedUpdate(float timeStep)
{
    const engine::scene::Transform* transform = m_world.FindTransform(m_entity);
    if (transform == nullptr || m_world.FindBody(m_entity) == nullptr)
    {
        return;
    }

    if (m_onGround)
    {
        m_inAirTimer = 0.0F;
    }
    else
    {
        m_inAirTimer += timeStep;
    }
    const bool softGrounded = IsSoftGrounded();

    const glm::quat rotation = transform->rotation;
    const glm::vec3 velocity = m_physics.LinearVelocity(m_entity);
    const glm::vec3 planeVelocity{velocity.x, 0.0F, velocity.z};

    const glm::vec3 moveDir = MovementDirection(m_controls.buttons);
    const float moveForce = softGrounded ? m_tuning.moveForce : m_tuning.inAirMoveForce;
    m_physics.ApplyImpulse(m_entity, rotation * moveDir * moveForce);

    if (softGrounded)
    {
        m_physics.ApplyImpulse(m_entity, -planeVelocity * m_tuning.brakeForce);

        if (!m_controls.IsDown(Controls::Jump))
        {
            m_jumpPrimed = true;
        }
        else if (m_jumpPrimed)
        {
            m_physics.ApplyImpulse(m_entity, glm::vec3{0.0F, m_tuning.jumpForce, 0.0F});
            m_jumpPrimed = false;
            ++m_jumpCount;
        }
        m_state = m_jumpPrimed ? CharacterState::JumpPrimed : CharacterState::Grounded;
    }
    else
    {
        m_state = CharacterState::Airborne;
    }

    auto animation = m_world.Animations().find(m_entity);
    if (animation != m_world.Animations().end())
    {
        engine::animation::AnimationController& controller = animation->second;
        if (softGrounded && glm::dot(moveDir, moveDir) > 0.0F)
        {
            controller.PlayExclusive(kWalkClip, 0, true, kWalkFadeTime);
        }
        else
        {
            controller.Stop(kWalkClip, kWalkFadeTime);
        }
        controller.SetSpeed(kWalkClip, glm::length(planeVelocity) * kWalkAnimationSpeedScale);
    }

    // Contacts of the coming step set it again.
    m_onGround = false;
}

void Character::HandleNodeCollision(const engine::physics::CollisionEvent& event)
{
    const engine::scene::Transform* transform = m_world.FindTransform(m_entity);
    if (transform == nullptr)
    {
        return;
    }

    for (const engine::physics::ContactPoint& contact : event.contacts)
    {
        // Below the node center and facing mostly up or down.
        if (contact.position.y < transform->position.y + 1.0F && std::abs(contact.normal.y) > 0.75F)
        {
            m_onGround = true;
        }
    }
}

void Character::ApplyControlsRotation()
{
    engine::scene::Transform* transform = m_world.FindTransform(m_entity);
    if (transform != nullptr)
    {
        transform->rotation = YawRotation(m_controls.yaw);
    }
}
} // namespace demo::character
