#include "demo/pages/EmbeddedSurface.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "engine/core/ErrorChannel.hpp"

namespace demo::pages
{
EmbeddedSurface::EmbeddedSurface(ApplicationFactory factory, engine::core::ErrorChannel* errors)
    : m_factory(std::move(factory))
    , m_errors(errors)
{
}

EmbeddedSurface::~EmbeddedSurface()
{
    OnDestroy();
}

template <typename Fn>
bool EmbeddedSurface::Guarded(const char* stage, Fn&& fn)
{
    try
    {
        fn();
        return true;
    }
    catch (const std::exception& ex)
    {
        const std::string message = std::string{stage} + ": " + ex.what();
        if (m_errors != nullptr)
        {
            m_errors->Report("EmbeddedSurface", message);
        }
        else
        {
            std::cerr << "EmbeddedSurface " << message << "\n";
        }
        return false;
    }
}

SurfaceApplication* EmbeddedSurface::Show(const SurfaceOptions& options)
{
    OnDestroy();
    if (!m_factory)
    {
        return nullptr;
    }

    std::unique_ptr<SurfaceApplication> application = m_factory();
    if (application == nullptr)
    {
        return nullptr;
    }

    std::string error;
    bool started = false;
    const bool completed = Guarded("start", [&]() { started = application->Start(options, &error); });
    if (!completed)
    {
        return nullptr;
    }
    if (!started)
    {
        if (m_errors != nullptr)
        {
            m_errors->Report("EmbeddedSurface", "Failed to start application: " + error);
        }
        return nullptr;
    }

    m_application = std::move(application);
    ++m_startCount;
    return m_application.get();
}

void EmbeddedSurface::OnDestroy()
{
    if (m_application == nullptr)
    {
        return;
    }

    std::unique_ptr<SurfaceApplication> application = std::move(m_application);
    (void)Guarded("stop", [&]() { application->Stop(); });
}

void EmbeddedSurface::Update(const SurfaceFrame& frame)
{
    if (m_application != nullptr)
    {
        (void)Guarded("update", [&]() { m_application->Update(frame); });
    }
}

void EmbeddedSurface::Render(engine::render::Renderer& renderer, const engine::ui::UiRect& viewport)
{
    if (m_application != nullptr)
    {
        (void)Guarded("render", [&]() { m_application->Render(renderer, viewport); });
    }
}

void EmbeddedSurface::BuildOverlay(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport)
{
    if (m_application != nullptr)
    {
        (void)Guarded("overlay", [&]() { m_application->BuildOverlay(ui, viewport); });
    }
}
} // namespace demo::pages
