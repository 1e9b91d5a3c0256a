#include "demo/character/Controls.hpp"

#include <cmath>

#include <glm/geometric.hpp>
#include <glm/trigonometric.hpp>

namespace demo::character
{
void Controls::Set(std::uint32_t mask, bool down)
{
    if (down)
    {
        buttons |= mask;
    }
    else
    {
        buttons &= ~mask;
    }
}

glm::vec3 MovementDirection(std::uint32_t buttons)
{
    glm::vec3 direction{0.0F};
    if ((buttons & Controls::Forward) != 0)
    {
        direction += glm::vec3{0.0F, 0.0F, -1.0F};
    }
    if ((buttons & Controls::Back) != 0)
    {
        direction += glm::vec3{0.0F, 0.0F, 1.0F};
    }
    if ((buttons & Controls::Left) != 0)
    {
        direction += glm::vec3{-1.0F, 0.0F, 0.0F};
    }
    if ((buttons & Controls::Right) != 0)
    {
        direction += glm::vec3{1.0F, 0.0F, 0.0F};
    }

    if (glm::dot(direction, direction) > 0.0F)
    {
        direction = glm::normalize(direction);
    }
    return direction;
}

glm::quat YawRotation(float yawDegrees)
{
    return glm::angleAxis(glm::radians(-yawDegrees), glm::vec3{0.0F, 1.0F, 0.0F});
}

float YawFromRotation(const glm::quat& rotation)
{
    const glm::vec3 forward = rotation * glm::vec3{0.0F, 0.0F, -1.0F};
    return glm::degrees(std::atan2(forward.x, -forward.z));
}

glm::quat LookRotation(float yawDegrees, float pitchDegrees)
{
    return YawRotation(yawDegrees) * glm::angleAxis(glm::radians(-pitchDegrees), glm::vec3{1.0F, 0.0F, 0.0F});
}
} // namespace demo::character
