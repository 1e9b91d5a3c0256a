#pragma once

#include <filesystem>
#include <string>

#include "engine/ui/UiSystem.hpp"

namespace engine::platform
{
class ActionBindings;
class Input;
}

namespace engine::render
{
class Renderer;
}

namespace ui
{
class DeveloperConsole;
struct ConsoleContext;
}

namespace demo::pages
{
struct SurfaceOptions
{
    // Resource directory prefix from ResolveDataPath.
    std::string resourcePath;
    std::filesystem::path programDir;
};

struct SurfaceFrame
{
    engine::platform::Input* input = nullptr;
    const engine::platform::ActionBindings* bindings = nullptr;
    // Null when running headless.
    engine::ui::UiSystem* ui = nullptr;
    ui::DeveloperConsole* console = nullptr;
    // UI pixels, top-left origin.
    engine::ui::UiRect viewport{};
    float deltaSeconds = 0.0F;
    // A page widget holds the pointer or the console has the keyboard.
    bool uiHasFocus = false;
};

/// Application hosted inside an EmbeddedSurface. One instance lives from
/// Start to Stop; restarting creates a fresh instance.
class SurfaceApplication
{
public:
    virtual ~SurfaceApplication() = default;

    [[nodiscard]] virtual bool Start(const SurfaceOptions& options, std::string* outError) = 0;
    virtual void Stop() = 0;

    virtual void Update(const SurfaceFrame& frame) = 0;
    /// |viewport| in framebuffer pixels, bottom-left origin.
    virtual void Render(engine::render::Renderer& renderer, const engine::ui::UiRect& viewport) = 0;
    /// Text and on-screen controls drawn over the viewport.
    virtual void BuildOverlay(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport)
    {
        (void)ui;
        (void)viewport;
    }

    virtual void FillConsoleContext(ui::ConsoleContext& context)
    {
        (void)context;
    }

    [[nodiscard]] virtual bool ExitRequested() const = 0;
};
} // namespace demo::pages
