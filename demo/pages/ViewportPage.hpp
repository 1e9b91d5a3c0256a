#pragma once

#include <functional>
#include <string>
#include <utility>

#include "demo/pages/EmbeddedSurface.hpp"
#include "demo/pages/Page.hpp"

namespace demo::pages
{
/// Embedded surface above a restart button and two sliders.
class ViewportPage final : public Page
{
public:
    using ValueChangedHandler = std::function<void(float)>;

    static constexpr const char* kTitle = " Character Surface Demo";
    static constexpr const char* kRestartLabel = "Restart";
    static constexpr const char* kRotationLabel = "ROTATION::";
    static constexpr const char* kSelectedValueLabel = "SELECTED VALUE:";
    static constexpr float kRotationMin = 0.0F;
    static constexpr float kRotationMax = 500.0F;
    static constexpr float kSelectedMin = 0.0F;
    static constexpr float kSelectedMax = 5.0F;

    ViewportPage(EmbeddedSurface::ApplicationFactory factory, SurfaceOptions options, engine::core::ErrorChannel* errors);

    [[nodiscard]] std::string Title() const override { return kTitle; }

    void OnAppearing() override;
    void OnDisappearing() override;

    void Build(PageContext& context) override;
    void Render(engine::render::Renderer& renderer, int framebufferWidth, int framebufferHeight) override;

    [[nodiscard]] EmbeddedSurface* Surface() override { return &m_surface; }

    /// Starts a fresh application instance in the surface.
    void RestartApplication();

    [[nodiscard]] float RotationValue() const { return m_rotation; }
    [[nodiscard]] float SelectedValue() const { return m_selectedValue; }

    /// Sets the value and notifies the handler.
    void SetSelectedValue(float value);
    /// Sets the value with the handler detached.
    void SelectBarValue(float value);
    void SetSelectedValueChangedHandler(ValueChangedHandler handler) { m_selectedValueChanged = std::move(handler); }

    /// Last layout of the surface, UI pixels.
    [[nodiscard]] const engine::ui::UiRect& SurfaceRect() const { return m_surfaceRect; }

private:
    EmbeddedSurface m_surface;
    SurfaceOptions m_options;

    float m_rotation = 250.0F;
    float m_selectedValue = 2.5F;
    ValueChangedHandler m_selectedValueChanged;
    engine::ui::UiRect m_surfaceRect{};
};
} // namespace demo::pages
