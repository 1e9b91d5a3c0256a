#pragma once

#include <optional>

namespace engine::platform
{
class Input;
struct TouchState;
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
constexpr float kGyroscopeThreshold = 0.1F;
constexpr float kDefaultTouchSensitivity = 2.0F;

/// Two finger zoom and gyroscope steering for touch mode.
class TouchControls
{
public:
    explicit TouchControls(float touchSensitivity = kDefaultTouchSensitivity);

    void Update(const engine::platform::Input& input, character::Controls& controls, camera::CameraRig& rig);

    /// Camera distance change for a pair of touches, or nullopt when they do
    /// not form a pinch on empty space.
    [[nodiscard]] std::optional<float> ZoomDelta(const engine::platform::TouchState& first, const engine::platform::TouchState& second) const;

    void SetUseGyroscope(bool useGyroscope) { m_useGyroscope = useGyroscope; }
    [[nodiscard]] bool UseGyroscope() const { return m_useGyroscope; }
    [[nodiscard]] bool IsZooming() const { return m_zoom; }

    void SetTouchSensitivity(float sensitivity) { m_touchSensitivity = sensitivity; }
    [[nodiscard]] float TouchSensitivity() const { return m_touchSensitivity; }

private:
    float m_touchSensitivity;
    bool m_zoom = false;
    bool m_useGyroscope = false;
};
} // namespace demo::input
