#include "engine/core/App.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include "demo/app/CharacterDemo.hpp"
#include "demo/pages/EmbeddedSurface.hpp"
#include "demo/pages/PlatformPaths.hpp"
#include "demo/pages/StartPage.hpp"
#include "demo/pages/SurfaceApplication.hpp"
#include "demo/pages/ViewportPage.hpp"
#include "engine/core/Profiler.hpp"

namespace engine::core
{
bool App::Run(int argc, const char* const* argv)
{
    std::cout << "Character Surface Demo\n";

    if (!LoadConfigs(argc, argv))
    {
        return false;
    }

    platform::WindowSettings windowSettings;
    windowSettings.width = m_graphicsSettings.width;
    windowSettings.height = m_graphicsSettings.height;
    windowSettings.fullscreen = m_graphicsSettings.fullscreen;
    windowSettings.vsync = m_graphicsSettings.vsync;
    windowSettings.fpsLimit = m_graphicsSettings.fpsLimit;

    if (!m_window.Initialize(windowSettings))
    {
        return false;
    }

    if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to initialize GLAD.\n";
        return false;
    }

    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";

    if (!m_renderer.Initialize(m_window.FramebufferWidth(), m_window.FramebufferHeight()))
    {
        std::cerr << "Failed to initialize renderer.\n";
        return false;
    }
    m_renderer.SetQuality(m_graphicsSettings.quality);

    InstallErrorListener();

    if (!m_ui.Initialize(&m_errors))
    {
        std::cerr << "Failed to initialize custom UI.\n";
        return false;
    }
    if (!m_console.Initialize(m_window))
    {
        std::cerr << "Warning: failed to initialize developer console.\n";
    }

    m_input.SetTouchEmulation(m_demoConfig.touchEmulation);
    platform::WindowEvents events;
    events.text = [this](unsigned int codepoint) { m_input.PushTextInput(codepoint); };
    events.scroll = [this](float delta) { m_input.PushScroll(delta); };
    m_window.SetEvents(std::move(events));

    PushStartPage();

    while (!m_window.ShouldClose() && !m_quitRequested)
    {
        auto& profiler = Profiler::Instance();
        profiler.BeginFrame();

        const double frameStart = m_window.TimeSeconds();
        m_time.BeginFrame(frameStart);
        const float deltaSeconds = static_cast<float>(m_time.DeltaSeconds());

        {
            CHARSURF_PROFILE_SCOPE("Input");
            m_window.PollEvents();
            m_input.Update(m_window.NativeHandle());
        }

        m_console.BeginFrame();

        const int windowWidth = m_window.WindowWidth();
        const int windowHeight = m_window.WindowHeight();
        const int framebufferWidth = m_window.FramebufferWidth();
        const int framebufferHeight = m_window.FramebufferHeight();

        m_ui.BeginFrame(ui::UiSystem::BeginFrameArgs{
            &m_input,
            framebufferWidth,
            framebufferHeight,
            windowWidth,
            windowHeight,
            deltaSeconds,
            true,
        });
        m_ui.ClaimTouches(m_input);

        const ui::UiRect contentRect = BuildNavigationBar();
        demo::pages::Page* page = m_navigation.Current();
        if (page != nullptr)
        {
            CHARSURF_PROFILE_SCOPE("Page");
            demo::pages::PageContext context{
                m_ui,
                m_input,
                m_actionBindings,
                m_navigation,
                &m_console,
                contentRect,
                deltaSeconds,
                m_console.WantsKeyboardCapture(),
            };
            page->Build(context);
        }
        m_navigation.ApplyPending();

        m_renderer.SetViewport(0, 0, framebufferWidth, framebufferHeight);
        const glm::vec4 background = m_ui.Theme().colorPanel;
        glClearColor(background.r, background.g, background.b, 1.0F);
        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

        page = m_navigation.Current();
        if (page != nullptr)
        {
            page->Render(m_renderer, framebufferWidth, framebufferHeight);
        }
        m_renderer.SetViewport(0, 0, framebufferWidth, framebufferHeight);

        const ::ui::ConsoleContext consoleContext = BuildConsoleContext();
        m_console.Render(consoleContext, m_ui, m_input);
        m_ui.EndFrame();

        m_errors.Dispatch();
        HandlePendingRestart();

        if (page != nullptr && page->Surface() != nullptr)
        {
            const demo::pages::SurfaceApplication* application = page->Surface()->Application();
            if (application != nullptr && application->ExitRequested())
            {
                m_quitRequested = true;
            }
        }

        {
            CHARSURF_PROFILE_SCOPE("Swap");
            m_window.SwapBuffers();
        }

        profiler.EndFrame();
        LimitFrameRate(frameStart);
    }

    Shutdown();
    return true;
}

bool App::LoadConfigs(int argc, const char* const* argv)
{
    const std::filesystem::path configDir(kConfigDirectory);
    std::error_code ec;
    std::filesystem::create_directories(configDir, ec);
    if (ec)
    {
        std::cerr << "Warning: unable to create " << configDir.string() << ": " << ec.message() << "\n";
    }

    std::string error;
    const std::string controlsPath = (configDir / "controls.json").string();
    if (!demo::app::LoadControlsSettings(controlsPath, &m_controlsSettings, &error))
    {
        std::cerr << "Warning: " << error << "\n";
    }
    m_actionBindings.ResetDefaults();
    if (!m_actionBindings.LoadFromJsonFile(controlsPath, &error))
    {
        std::cerr << "Warning: " << error << ". Using default bindings.\n";
        m_actionBindings.ResetDefaults();
        if (!m_actionBindings.SaveToJsonFile(controlsPath, &error))
        {
            std::cerr << "Warning: " << error << "\n";
        }
    }

    if (!demo::app::LoadGraphicsSettings((configDir / "graphics.json").string(), &m_graphicsSettings, &error))
    {
        std::cerr << "Warning: " << error << "\n";
    }
    if (!demo::app::LoadDemoConfig((configDir / "demo.json").string(), &m_demoConfig, &error))
    {
        std::cerr << "Warning: " << error << "\n";
    }

    if (!demo::app::ApplyCommandLine(argc, argv, &m_demoConfig, &error))
    {
        std::cerr << "Failed to parse command line: " << error << "\n";
        return false;
    }

    m_programDir = std::filesystem::current_path(ec);
    if (argc > 0 && argv[0] != nullptr)
    {
        const std::filesystem::path executable = std::filesystem::absolute(argv[0], ec);
        if (!ec && executable.has_parent_path())
        {
            m_programDir = executable.parent_path();
        }
    }
    return true;
}

void App::InstallErrorListener()
{
    // The channel logs to stderr itself; the console gets a copy.
    (void)m_errors.Subscribe([this](const ErrorReport& report) {
        m_console.Commands().AddLog(std::string{"[error] "} + report.source + ": " + report.message);
    });
}

void App::PushStartPage()
{
    m_navigation.Clear();
    m_navigation.Push(std::make_unique<demo::pages::StartPage>([this]() -> std::unique_ptr<demo::pages::Page> {
        return std::make_unique<demo::pages::ViewportPage>(
            [this]() -> std::unique_ptr<demo::pages::SurfaceApplication> {
                demo::app::CharacterDemoOptions options;
                options.config = m_demoConfig;
                options.controls = m_controlsSettings;
                options.quality = m_graphicsSettings.quality;
                options.errors = &m_errors;
                return std::make_unique<demo::app::CharacterDemo>(m_actionBindings, options);
            },
            BuildSurfaceOptions(),
            &m_errors
        );
    }));
}

demo::pages::SurfaceOptions App::BuildSurfaceOptions() const
{
    const std::string platform = m_demoConfig.platform.empty() ? demo::pages::CurrentPlatform() : m_demoConfig.platform;
    demo::pages::SurfaceOptions options;
    options.resourcePath = demo::pages::ResolveDataPath(platform);
    options.programDir = m_programDir;
    return options;
}

ui::UiRect App::BuildNavigationBar()
{
    const float width = static_cast<float>(m_ui.ScreenWidth());
    const float height = static_cast<float>(m_ui.ScreenHeight());
    const ui::UiRect bar{0.0F, 0.0F, width, kNavigationBarHeight};
    const ui::UiTheme& theme = m_ui.Theme();

    m_ui.DrawRect(bar, theme.colorPanel);
    m_ui.DrawRect(ui::UiRect{0.0F, bar.h - 1.0F, width, 1.0F}, theme.colorPanelBorder);

    float titleX = 16.0F;
    if (m_navigation.Depth() > 1)
    {
        const ui::UiRect back{8.0F, 6.0F, 88.0F, bar.h - 12.0F};
        if (m_ui.ButtonAt("nav_back", "Back", back))
        {
            m_navigation.RequestPop();
        }
        titleX = back.x + back.w + 12.0F;
    }

    const demo::pages::Page* page = m_navigation.Current();
    if (page != nullptr)
    {
        const float textY = (bar.h - m_ui.LineHeight(0.9F)) * 0.5F;
        m_ui.DrawTextLabel(titleX, textY, page->Title(), theme.colorText, 0.9F);
    }

    return ui::UiRect{0.0F, bar.h, width, std::max(height - bar.h, 0.0F)};
}

::ui::ConsoleContext App::BuildConsoleContext()
{
    ::ui::ConsoleContext context;
    demo::pages::Page* page = m_navigation.Current();
    if (page != nullptr && page->Surface() != nullptr && page->Surface()->Application() != nullptr)
    {
        page->Surface()->Application()->FillConsoleContext(context);
    }

    context.setSeed = [this](std::uint32_t seed) { m_demoConfig.randomSeed = seed; };
    context.restart = [this]() { m_restartRequested = true; };
    context.quit = [this]() { m_quitRequested = true; };
    return context;
}

void App::HandlePendingRestart()
{
    if (!m_restartRequested)
    {
        return;
    }
    m_restartRequested = false;

    auto* viewportPage = dynamic_cast<demo::pages::ViewportPage*>(m_navigation.Current());
    if (viewportPage != nullptr)
    {
        viewportPage->RestartApplication();
    }
}

void App::LimitFrameRate(double frameStart) const
{
    const int fpsLimit = m_graphicsSettings.fpsLimit;
    if (m_graphicsSettings.vsync || fpsLimit <= 0)
    {
        return;
    }

    const double targetSeconds = 1.0 / static_cast<double>(fpsLimit);
    double elapsed = m_window.TimeSeconds() - frameStart;
    if (elapsed >= targetSeconds)
    {
        return;
    }

    const double sleepThreshold = 0.002;
    const double remaining = targetSeconds - elapsed;
    if (remaining > sleepThreshold)
    {
        std::this_thread::sleep_for(std::chrono::duration<double>(remaining - sleepThreshold));
    }
    while ((elapsed = m_window.TimeSeconds() - frameStart) < targetSeconds)
    {
    }
}

void App::Shutdown()
{
    m_navigation.Clear();
    m_console.Shutdown();
    m_ui.Shutdown();
    m_renderer.Shutdown();
    m_window.Shutdown();
}
} // namespace engine::core
