#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "demo/character/Character.hpp"
#include "engine/core/Profiler.hpp"
#include "engine/render/RenderQuality.hpp"
#include "engine/ui/UiSystem.hpp"

namespace engine::platform
{
class ActionBindings;
class Input;
}

namespace demo::app
{
struct HostActions
{
    bool exitRequested = false;
    bool toggleConsole = false;
    bool screenshotRequested = false;
    bool qualityChanged = false;
};

struct DebugHudInfo
{
    engine::core::FrameStats stats{};
    std::size_t dynamicBodies = 0;
    std::size_t staticSolids = 0;
    character::CharacterState characterState = character::CharacterState::Airborne;
    float inAirTime = 0.0F;
    float cameraDistance = 0.0F;
    bool firstPerson = false;
    bool touchEnabled = false;
    bool gyroscope = false;
    engine::render::RenderQuality quality{};
};

/// Keys every sample shares: exit, console, debug HUD and the renderer
/// quality toggles on the number row.
class SampleHost
{
public:
    static constexpr const char* kInstructions =
        "Use WASD keys and mouse/touch to move\nSpace to jump, F to toggle 1st/3rd person\nF5 to save scene, F7 to load";

    explicit SampleHost(std::string sampleName);

    /// Quality keys are ignored while |uiHasFocus|. Esc closes an open console
    /// before it exits.
    HostActions HandleKeys(
        const engine::platform::Input& input,
        const engine::platform::ActionBindings& bindings,
        engine::render::RenderQuality& quality,
        bool consoleOpen,
        bool uiHasFocus
    );

    /// "Data/Screenshot_<sample>_yyyy-MM-dd-HH-mm-ss.png" under |dataPath|.
    [[nodiscard]] std::string ScreenshotPath(const std::string& dataPath, std::chrono::system_clock::time_point when) const;

    void DrawInstructions(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport) const;
    void DrawDebugHud(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport, const DebugHudInfo& info) const;

    void SetDebugHudVisible(bool visible) { m_debugHudVisible = visible; }
    [[nodiscard]] bool DebugHudVisible() const { return m_debugHudVisible; }
    [[nodiscard]] const std::string& SampleName() const { return m_sampleName; }

private:
    std::string m_sampleName;
    bool m_debugHudVisible = false;
};
} // namespace demo::app
