#include "demo/input/TouchControls.hpp"

#include <cmath>

#include "demo/camera/CameraRig.hpp"
#include "demo/character/Controls.hpp"
#include "engine/platform/Input.hpp"

namespace demo::input
{
TouchControls::TouchControls(float touchSensitivity)
    : m_touchSensitivity(touchSensitivity)
{
}

std::optional<float> TouchControls::ZoomDelta(const engine::platform::TouchState& first, const engine::platform::TouchState& second) const
{
    if (first.overUiElement || second.overUiElement)
    {
        return std::nullopt;
    }

    const bool opposite = (first.delta.y > 0.0F && second.delta.y < 0.0F) || (first.delta.y < 0.0F && second.delta.y > 0.0F);
    if (!opposite)
    {
        return std::nullopt;
    }

    // Spreading the fingers moves the camera in.
    const float separation = std::abs(first.position.y - second.position.y);
    const float lastSeparation = std::abs(first.lastPosition.y - second.lastPosition.y);
    const float sign = separation > lastSeparation ? -1.0F : 1.0F;
    return std::abs(first.delta.y - second.delta.y) * sign * m_touchSensitivity / 50.0F;
}

void TouchControls::Update(const engine::platform::Input& input, character::Controls& controls, camera::CameraRig& rig)
{
    m_zoom = false;

    if (input.NumTouches() == 2)
    {
        const std::optional<float> delta = ZoomDelta(input.Touch(0), input.Touch(1));
        if (delta.has_value())
        {
            m_zoom = true;
            rig.ApplyZoom(*delta);
        }
    }

    // Phones expose the gyroscope as a virtual joystick.
    if (m_useGyroscope && input.NumJoysticks() > 0)
    {
        const engine::platform::JoystickState* joystick = input.Joystick(0);
        if (joystick != nullptr && joystick->axes.size() >= 2)
        {
            if (joystick->AxisPosition(0) < -kGyroscopeThreshold)
            {
                controls.Set(character::Controls::Left, true);
            }
            if (joystick->AxisPosition(0) > kGyroscopeThreshold)
            {
                controls.Set(character::Controls::Right, true);
            }
            if (joystick->AxisPosition(1) < -kGyroscopeThreshold)
            {
                controls.Set(character::Controls::Forward, true);
            }
            if (joystick->AxisPosition(1) > kGyroscopeThreshold)
            {
                controls.Set(character::Controls::Back, true);
            }
        }
    }
}
} // namespace demo::input
