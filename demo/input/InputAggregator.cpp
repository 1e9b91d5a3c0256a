#include "demo/input/InputAggregator.hpp"

#include <algorithm>
#include <cstdint>

#include "demo/camera/CameraRig.hpp"
#include "demo/character/Controls.hpp"
#include "demo/input/ScreenJoystick.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"

namespace demo::input
{
using engine::platform::InputAction;

InputAggregator::InputAggregator(const engine::platform::ActionBindings& bindings, AggregatorSettings settings)
    : m_bindings(bindings)
    , m_settings(settings)
    , m_touch(settings.touchSensitivity)
{
}

bool InputAggregator::SetUseGyroscope(bool enabled)
{
    if (!m_touchEnabled)
    {
        return false;
    }
    m_touch.SetUseGyroscope(enabled);
    return true;
}

AggregatorRequests InputAggregator::Update(
    const engine::platform::Input& input,
    character::Controls& controls,
    camera::CameraRig& rig,
    const AggregatorFrame& frame
)
{
    AggregatorRequests requests;
    controls.Set(character::Controls::All, false);

    if (m_touchEnabled)
    {
        m_touch.Update(input, controls, rig);
    }

    if (frame.uiHasFocus)
    {
        return requests;
    }

    const bool useGyroscope = m_touchEnabled && m_touch.UseGyroscope();
    if (!useGyroscope)
    {
        controls.Set(character::Controls::Forward, m_bindings.IsDown(input, InputAction::MoveForward));
        controls.Set(character::Controls::Back, m_bindings.IsDown(input, InputAction::MoveBack));
        controls.Set(character::Controls::Left, m_bindings.IsDown(input, InputAction::MoveLeft));
        controls.Set(character::Controls::Right, m_bindings.IsDown(input, InputAction::MoveRight));
    }
    if (m_bindings.IsDown(input, InputAction::Jump))
    {
        controls.Set(character::Controls::Jump, true);
    }

    if (m_touchEnabled && frame.screenJoystick != nullptr)
    {
        std::uint32_t joystickButtons = frame.screenJoystick->buttons;
        if (useGyroscope)
        {
            joystickButtons &= character::Controls::Jump;
        }
        controls.Set(joystickButtons, true);
    }

    if (m_touchEnabled)
    {
        const float touchScale = m_settings.touchSensitivity * frame.fovDegrees / std::max(frame.viewportHeight, 1.0F);
        for (const engine::platform::TouchState& touch : input.Touches())
        {
            if (touch.overUiElement)
            {
                continue;
            }
            controls.yaw += touchScale * touch.delta.x;
            controls.pitch += touchScale * touch.delta.y;
        }
    }
    else
    {
        const glm::vec2 mouseDelta = input.MouseDelta();
        controls.yaw += mouseDelta.x * m_settings.yawSensitivity;
        controls.pitch += mouseDelta.y * m_settings.yawSensitivity;
    }
    controls.pitch = std::clamp(controls.pitch, -kPitchLimit, kPitchLimit);

    const bool joystickToggle = frame.screenJoystick != nullptr && frame.screenJoystick->toggleFirstPerson;
    if (m_bindings.IsPressed(input, InputAction::ToggleFirstPerson) || (m_touchEnabled && joystickToggle))
    {
        rig.ToggleFirstPerson();
    }
    if (m_touchEnabled && m_bindings.IsPressed(input, InputAction::ToggleGyroscope))
    {
        m_touch.SetUseGyroscope(!m_touch.UseGyroscope());
    }

    requests.saveScene = m_bindings.IsPressed(input, InputAction::SaveScene);
    requests.loadScene = m_bindings.IsPressed(input, InputAction::LoadScene);
    return requests;
}
} // namespace demo::input
