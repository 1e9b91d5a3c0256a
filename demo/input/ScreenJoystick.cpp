#include "demo/input/ScreenJoystick.hpp"

#include <cstddef>

#include <glm/common.hpp>

#include "demo/character/Controls.hpp"
#include "engine/platform/Input.hpp"

namespace demo::input
{
void ScreenJoystick::Layout(const engine::ui::UiRect& viewport, float uiScale)
{
    const float margin = 24.0F * uiScale;
    const float padSize = 180.0F * uiScale;
    const float buttonWidth = 120.0F * uiScale;
    const float buttonHeight = 56.0F * uiScale;

    m_padRect = engine::ui::UiRect{viewport.x + margin, viewport.y + viewport.h - margin - padSize, padSize, padSize};
    m_jumpRect = engine::ui::UiRect{
        viewport.x + viewport.w - margin - buttonWidth,
        viewport.y + viewport.h - margin - buttonHeight,
        buttonWidth,
        buttonHeight,
    };
    m_firstPersonRect = m_jumpRect;
    m_firstPersonRect.y -= buttonHeight + margin * 0.5F;
}

bool ScreenJoystick::Contains(const glm::vec2& point) const
{
    return m_padRect.Contains(point.x, point.y) || m_firstPersonRect.Contains(point.x, point.y) ||
           m_jumpRect.Contains(point.x, point.y);
}

ScreenJoystickState ScreenJoystick::Update(engine::platform::Input& input, const glm::vec2& windowToUi)
{
    ScreenJoystickState state;
    m_axes = glm::vec2{0.0F};
    bool firstPersonHeld = false;
    bool jumpHeld = false;

    for (std::size_t i = 0; i < input.NumTouches(); ++i)
    {
        const glm::vec2 point = input.Touch(i).position * windowToUi;
        if (m_padRect.Contains(point.x, point.y))
        {
            const glm::vec2 center{m_padRect.x + m_padRect.w * 0.5F, m_padRect.y + m_padRect.h * 0.5F};
            const glm::vec2 offset = (point - center) / (m_padRect.w * 0.5F);
            m_axes = glm::clamp(offset, glm::vec2{-1.0F}, glm::vec2{1.0F});
        }
        else if (m_firstPersonRect.Contains(point.x, point.y))
        {
            firstPersonHeld = true;
        }
        else if (m_jumpRect.Contains(point.x, point.y))
        {
            jumpHeld = true;
        }
        else
        {
            continue;
        }
        input.MarkTouchOverUi(i, true);
    }

    // Screen y grows downward, so pushing up walks forward.
    if (m_axes.x < -kAxisDeadZone)
    {
        state.buttons |= character::Controls::Left;
    }
    if (m_axes.x > kAxisDeadZone)
    {
        state.buttons |= character::Controls::Right;
    }
    if (m_axes.y < -kAxisDeadZone)
    {
        state.buttons |= character::Controls::Forward;
    }
    if (m_axes.y > kAxisDeadZone)
    {
        state.buttons |= character::Controls::Back;
    }
    if (jumpHeld)
    {
        state.buttons |= character::Controls::Jump;
    }

    state.toggleFirstPerson = firstPersonHeld && !m_firstPersonHeld;
    state.axes = m_axes;
    m_firstPersonHeld = firstPersonHeld;
    m_jumpHeld = jumpHeld;
    return state;
}

void ScreenJoystick::Draw(engine::ui::UiSystem& ui) const
{
    const engine::ui::UiTheme& theme = ui.Theme();
    glm::vec4 padColor = theme.colorPanel;
    padColor.a = 0.45F;

    ui.DrawRect(m_padRect, padColor);
    ui.DrawRectOutline(m_padRect, 2.0F, theme.colorPanelBorder);

    const float knobSize = m_padRect.w * 0.3F;
    const glm::vec2 center{m_padRect.x + m_padRect.w * 0.5F, m_padRect.y + m_padRect.h * 0.5F};
    const glm::vec2 knob = center + m_axes * (m_padRect.w * 0.5F - knobSize * 0.5F);
    ui.DrawRect(engine::ui::UiRect{knob.x - knobSize * 0.5F, knob.y - knobSize * 0.5F, knobSize, knobSize}, theme.colorAccent);

    const auto drawButton = [&ui, &theme](const engine::ui::UiRect& rect, const char* label, bool held) {
        ui.DrawRect(rect, held ? theme.colorButtonPressed : theme.colorButton);
        ui.DrawRectOutline(rect, 2.0F, theme.colorPanelBorder);
        const float textWidth = ui.TextWidth(label);
        ui.DrawTextLabel(rect.x + (rect.w - textWidth) * 0.5F, rect.y + (rect.h - ui.LineHeight()) * 0.5F, label, theme.colorText);
    };
    drawButton(m_firstPersonRect, kFirstPersonLabel, m_firstPersonHeld);
    drawButton(m_jumpRect, kJumpLabel, m_jumpHeld);
}
} // namespace demo::input
