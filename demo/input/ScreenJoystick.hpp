#pragma once

#include <cstdint>

#include <glm/vec2.hpp>

#include "engine/ui/UiSystem.hpp"

namespace engine::platform
{
class Input;
}

namespace demo::input
{
struct ScreenJoystickState
{
    // Controls bits held through the pad and the jump button.
    std::uint32_t buttons = 0;
    bool toggleFirstPerson = false;
    glm::vec2 axes{0.0F, 0.0F};
};

/// On-screen pad and buttons for touch mode. Touches landing on any element
/// are marked as over UI so gestures ignore them.
class ScreenJoystick
{
public:
    static constexpr const char* kFirstPersonLabel = "1st/3rd";
    static constexpr const char* kJumpLabel = "Jump";
    static constexpr float kAxisDeadZone = 0.3F;

    /// |viewport| and |uiScale| are in UI pixels.
    void Layout(const engine::ui::UiRect& viewport, float uiScale);
    ScreenJoystickState Update(engine::platform::Input& input, const glm::vec2& windowToUi);
    void Draw(engine::ui::UiSystem& ui) const;

    [[nodiscard]] bool Contains(const glm::vec2& point) const;
    [[nodiscard]] const engine::ui::UiRect& PadRect() const { return m_padRect; }
    [[nodiscard]] const engine::ui::UiRect& FirstPersonButtonRect() const { return m_firstPersonRect; }
    [[nodiscard]] const engine::ui::UiRect& JumpButtonRect() const { return m_jumpRect; }

private:
    engine::ui::UiRect m_padRect{};
    engine::ui::UiRect m_firstPersonRect{};
    engine::ui::UiRect m_jumpRect{};

    glm::vec2 m_axes{0.0F, 0.0F};
    bool m_firstPersonHeld = false;
    bool m_jumpHeld = false;
};
} // namespace demo::input
