#pragma once

#include <filesystem>
#include <string>

#include "demo/app/DemoSettings.hpp"
#include "demo/pages/Page.hpp"
#include "engine/core/ErrorChannel.hpp"
#include "engine/core/FrameClock.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"
#include "engine/platform/Window.hpp"
#include "engine/render/Renderer.hpp"
#include "engine/ui/UiSystem.hpp"
#include "ui/DeveloperConsole.hpp"

namespace demo::pages
{
struct SurfaceOptions;
}

namespace engine::core
{
/// Native host: window, page navigation and the console around the
/// embedded character sample.
class App
{
public:
    static constexpr const char* kConfigDirectory = "config";
    static constexpr float kNavigationBarHeight = 48.0F;

    bool Run(int argc, const char* const* argv);

private:
    bool LoadConfigs(int argc, const char* const* argv);
    void InstallErrorListener();
    void PushStartPage();
    [[nodiscard]] demo::pages::SurfaceOptions BuildSurfaceOptions() const;

    /// Title and back button. Returns the page content area below it.
    [[nodiscard]] ui::UiRect BuildNavigationBar();
    [[nodiscard]] ::ui::ConsoleContext BuildConsoleContext();
    void HandlePendingRestart();
    void LimitFrameRate(double frameStart) const;
    void Shutdown();

    platform::Window m_window;
    platform::Input m_input;
    platform::ActionBindings m_actionBindings;
    render::Renderer m_renderer;
    ui::UiSystem m_ui;
    ::ui::DeveloperConsole m_console;
    ErrorChannel m_errors;
    FrameClock m_time;
    demo::pages::NavigationStack m_navigation;

    demo::app::ControlsSettings m_controlsSettings;
    demo::app::GraphicsSettings m_graphicsSettings;
    demo::app::DemoConfig m_demoConfig;
    std::filesystem::path m_programDir;

    bool m_quitRequested = false;
    bool m_restartRequested = false;
};
} // namespace engine::core
