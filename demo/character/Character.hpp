#pragma once

#include <cstddef>

#include "demo/character/Controls.hpp"
#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"

namespace demo::character
{
/// Air phase combined with the jump latch. The latch itself survives air time,
/// only a jump disarms it.
enum class CharacterState
{
    Airborne,
    // Soft-grounded with the latch disarmed by a jump still held.
    Grounded,
    // Soft-grounded with the latch armed; the next held Jump jumps.
    JumpPrimed
};

struct CharacterTuning
{
    float moveForce = 0.8F;
    float inAirMoveForce = 0.02F;
    float brakeForce = 0.2F;
    float jumpForce = 7.0F;
    float inAirThresholdTime = 0.1F;
};

[[nodiscard]] const char* CharacterStateToText(CharacterState state);

/// Physics-driven walker bound to one entity. FixedUpdate runs from the
/// physics pre-step, ground contacts arrive through the collision callback.
class Character
{
public:
    static constexpr const char* kWalkClip = "Models/Jack_Walk.ani";
    static constexpr const char* kHeadBone = "Bip01_Head";
    static constexpr float kWalkAnimationSpeedScale = 0.3F;
    static constexpr float kWalkFadeTime = 0.2F;

    Character(engine::scene::World& world, engine::physics::PhysicsWorld& physics, engine::scene::Entity entity, CharacterTuning tuning = {});
    ~Character();

    Character(const Character&) = delete;
    Character& operator=(const Character&) = delete;

    /// Subscribes to the physics pre-step and the entity's collisions.
    void Attach();
    void Detach();
    [[nodiscard]] bool IsAttached() const { return m_preStepToken != 0; }

    void FixedUpdate(float timeStep);
    void HandleNodeCollision(const engine::physics::CollisionEvent& event);

    /// Writes the yaw from the controls into the node rotation.
    void ApplyControlsRotation();

    [[nodiscard]] Controls& GetControls() { return m_controls; }
    [[nodiscard]] const Controls& GetControls() const { return m_controls; }
    [[nodiscard]] engine::scene::Entity GetEntity() const { return m_entity; }
    [[nodiscard]] CharacterState State() const { return m_state; }
    [[nodiscard]] bool IsOnGround() const { return m_onGround; }
    [[nodiscard]] float InAirTime() const { return m_inAirTimer; }
    [[nodiscard]] bool IsSoftGrounded() const { return m_inAirTimer < m_tuning.inAirThresholdTime; }
    [[nodiscard]] bool IsJumpPrimed() const { return m_jumpPrimed; }
    [[nodiscard]] std::size_t JumpCount() const { return m_jumpCount; }
    [[nodiscard]] const CharacterTuning& Tuning() const { return m_tuning; }

private:
    engine::scene::World& m_world;
    engine::physics::PhysicsWorld& m_physics;
    engine::scene::Entity m_entity;
    CharacterTuning m_tuning;

    Controls m_controls;
    CharacterState m_state = CharacterState::Airborne;
    bool m_onGround = false;
    bool m_jumpPrimed = true;
    float m_inAirTimer = 0.0F;
    std::size_t m_jumpCount = 0;

    std::size_t m_preStepToken = 0;
    std::size_t m_collisionToken = 0;
};
} // namespace demo::character
