#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "demo/pages/SurfaceApplication.hpp"

namespace engine::core
{
class ErrorChannel;
}

namespace demo::pages
{
/// Region of a page that runs one SurfaceApplication. Failures thrown by the
/// application are reported to the error channel and never leave the surface.
class EmbeddedSurface
{
public:
    using ApplicationFactory = std::function<std::unique_ptr<SurfaceApplication>()>;

    EmbeddedSurface(ApplicationFactory factory, engine::core::ErrorChannel* errors);
    ~EmbeddedSurface();

    EmbeddedSurface(const EmbeddedSurface&) = delete;
    EmbeddedSurface& operator=(const EmbeddedSurface&) = delete;

    /// Creates and starts a new instance, replacing any running one.
    SurfaceApplication* Show(const SurfaceOptions& options);
    /// Stops and releases the running instance.
    void OnDestroy();

    void Update(const SurfaceFrame& frame);
    void Render(engine::render::Renderer& renderer, const engine::ui::UiRect& viewport);
    void BuildOverlay(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport);

    [[nodiscard]] bool IsRunning() const { return m_application != nullptr; }
    [[nodiscard]] SurfaceApplication* Application() const { return m_application.get(); }
    [[nodiscard]] std::size_t StartCount() const { return m_startCount; }

private:
    template <typename Fn>
    bool Guarded(const char* stage, Fn&& fn);

    ApplicationFactory m_factory;
    engine::core::ErrorChannel* m_errors = nullptr;
    std::unique_ptr<SurfaceApplication> m_application;
    std::size_t m_startCount = 0;
};
} // namespace demo::pages
