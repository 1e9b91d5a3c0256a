#pragma once

#include <cstdint>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>

namespace demo::character
{
/// Held buttons plus accumulated look angles in degrees.
struct Controls
{
    static constexpr std::uint32_t Forward = 1U;
    static constexpr std::uint32_t Back = 2U;
    static constexpr std::uint32_t Left = 4U;
    static constexpr std::uint32_t Right = 8U;
    static constexpr std::uint32_t Jump = 16U;
    static constexpr std::uint32_t All = Forward | Back | Left | Right | Jump;

    std::uint32_t buttons = 0;
    float yaw = 0.0F;
    float pitch = 0.0F;

    void Set(std::uint32_t mask, bool down);
    [[nodiscard]] bool IsDown(std::uint32_t mask) const { return (buttons & mask) != 0; }
    void Reset() { buttons = 0; }
};

/// Local-space direction for the held movement buttons, unit length or zero.
/// Forward is -Z, right is +X.
[[nodiscard]] glm::vec3 MovementDirection(std::uint32_t buttons);

/// Character node rotation for a yaw in degrees.
[[nodiscard]] glm::quat YawRotation(float yawDegrees);
/// Inverse of YawRotation for rotations about the up axis.
[[nodiscard]] float YawFromRotation(const glm::quat& rotation);
/// Yaw then pitch; positive pitch looks down.
[[nodiscard]] glm::quat LookRotation(float yawDegrees, float pitchDegrees);
} // namespace demo::character
