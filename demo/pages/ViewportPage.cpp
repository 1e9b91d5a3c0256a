#include "demo/pages/ViewportPage.hpp"

#include <algorithm>
#include <utility>

#include "engine/render/Renderer.hpp"

namespace demo::pages
{
namespace
{
// Unscaled height of a label row.
constexpr float kLabelRowHeight = 24.0F;
} // namespace

ViewportPage::ViewportPage(EmbeddedSurface::ApplicationFactory factory, SurfaceOptions options, engine::core::ErrorChannel* errors)
    : m_surface(std::move(factory), errors)
    , m_options(std::move(options))
    , m_selectedValueChanged([](float) {})
{
}

void ViewportPage::OnAppearing()
{
    RestartApplication();
}

void ViewportPage::OnDisappearing()
{
    m_surface.OnDestroy();
}

void ViewportPage::RestartApplication()
{
    (void)m_surface.Show(m_options);
}

void ViewportPage::SetSelectedValue(float value)
{
    m_selectedValue = std::clamp(value, kSelectedMin, kSelectedMax);
    if (m_selectedValueChanged)
    {
        m_selectedValueChanged(m_selectedValue);
    }
}

void ViewportPage::SelectBarValue(float value)
{
    ValueChangedHandler handler = std::move(m_selectedValueChanged);
    m_selectedValueChanged = nullptr;
    SetSelectedValue(value);
    m_selectedValueChanged = std::move(handler);
}

void ViewportPage::Build(PageContext& context)
{
    engine::ui::UiSystem& ui = context.ui;
    ui.BeginPanel(context.contentRect, engine::ui::UiPadding{12.0F, 12.0F, 12.0F, 40.0F}, false);

    const float spacing = ui.Theme().spacing;
    const float reserve = engine::ui::UiSystem::kButtonHeight + kLabelRowHeight * 2.0F + engine::ui::UiSystem::kSliderHeight * 2.0F + spacing * 5.0F;
    m_surfaceRect = ui.AllocateRemaining(reserve);

    SurfaceFrame frame;
    frame.input = &context.input;
    frame.bindings = &context.bindings;
    frame.ui = &ui;
    frame.console = context.console;
    frame.viewport = m_surfaceRect;
    frame.deltaSeconds = context.deltaSeconds;
    frame.uiHasFocus = context.consoleHasFocus || ui.HasActiveWidget();
    m_surface.Update(frame);
    m_surface.BuildOverlay(ui, m_surfaceRect);

    if (ui.Button("restart", kRestartLabel))
    {
        RestartApplication();
    }

    ui.Label(kRotationLabel);
    (void)ui.SliderFloat("rotation", &m_rotation, kRotationMin, kRotationMax, "%.0f");

    ui.Label(kSelectedValueLabel);
    float selected = m_selectedValue;
    if (ui.SliderFloat("selected_value", &selected, kSelectedMin, kSelectedMax, "%.2f"))
    {
        SetSelectedValue(selected);
    }

    ui.EndPanel();
}

void ViewportPage::Render(engine::render::Renderer& renderer, int framebufferWidth, int framebufferHeight)
{
    (void)framebufferWidth;
    // UI space has a top-left origin, GL viewports a bottom-left one.
    const engine::ui::UiRect viewport{
        m_surfaceRect.x,
        static_cast<float>(framebufferHeight) - (m_surfaceRect.y + m_surfaceRect.h),
        m_surfaceRect.w,
        m_surfaceRect.h,
    };
    m_surface.Render(renderer, viewport);
}
} // namespace demo::pages
