#pragma once

#include "demo/input/TouchControls.hpp"

namespace engine::platform
{
class ActionBindings;
class Input;
}

namespace demo::character
{
struct Controls;
}

namespace demo::camera
{
class CameraRig;
}

namespace demo::input
{
struct ScreenJoystickState;

constexpr float kYawSensitivity = 0.1F;
constexpr float kPitchLimit = 80.0F;

struct AggregatorSettings
{
    float yawSensitivity = kYawSensitivity;
    float touchSensitivity = kDefaultTouchSensitivity;
};

/// Scene requests raised this tick, handled by the owner of the scene.
struct AggregatorRequests
{
    bool saveScene = false;
    bool loadScene = false;
};

struct AggregatorFrame
{
    float fovDegrees = 45.0F;
    float viewportHeight = 720.0F;
    // Console open or a widget dragged.
    bool uiHasFocus = false;
    const ScreenJoystickState* screenJoystick = nullptr;
};

/// Folds keyboard, mouse, touch and gyroscope input into the character controls
/// once per rendered frame.
class InputAggregator
{
public:
    InputAggregator(const engine::platform::ActionBindings& bindings, AggregatorSettings settings = {});

    AggregatorRequests Update(
        const engine::platform::Input& input,
        character::Controls& controls,
        camera::CameraRig& rig,
        const AggregatorFrame& frame
    );

    void SetTouchEnabled(bool enabled) { m_touchEnabled = enabled; }
    [[nodiscard]] bool TouchEnabled() const { return m_touchEnabled; }
    /// Fails when touch input is disabled.
    bool SetUseGyroscope(bool enabled);

    [[nodiscard]] TouchControls& Touch() { return m_touch; }
    [[nodiscard]] const TouchControls& Touch() const { return m_touch; }
    [[nodiscard]] const AggregatorSettings& Settings() const { return m_settings; }

private:
    const engine::platform::ActionBindings& m_bindings;
    AggregatorSettings m_settings;
    TouchControls m_touch;
    bool m_touchEnabled = false;
};
} // namespace demo::input
