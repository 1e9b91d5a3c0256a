#pragma once

#include <cstdint>
#include <string>

#include "engine/render/RenderQuality.hpp"

namespace demo::app
{
struct ControlsSettings
{
    int assetVersion = 1;
    float yawSensitivity = 0.1F;
    float touchSensitivity = 2.0F;
};

struct GraphicsSettings
{
    int assetVersion = 1;
    int width = 1280;
    int height = 720;
    bool fullscreen = false;
    bool vsync = true;
    int fpsLimit = 0;
    engine::render::RenderQuality quality{};
};

struct DemoConfig
{
    int assetVersion = 1;
    bool touchEmulation = false;
    // 0 seeds from the clock.
    std::uint32_t randomSeed = 0;
    int mushroomCount = 60;
    int boxCount = 100;
    int fixedHz = 60;
    // Empty uses the build platform.
    std::string platform;
};

/// Missing files are written with defaults. Unreadable or invalid files keep
/// the defaults and report why in |outError|.
[[nodiscard]] bool LoadControlsSettings(const std::string& path, ControlsSettings* outSettings, std::string* outError = nullptr);
[[nodiscard]] bool SaveControlsSettings(const std::string& path, const ControlsSettings& settings, std::string* outError = nullptr);

[[nodiscard]] bool LoadGraphicsSettings(const std::string& path, GraphicsSettings* outSettings, std::string* outError = nullptr);
[[nodiscard]] bool SaveGraphicsSettings(const std::string& path, const GraphicsSettings& settings, std::string* outError = nullptr);

[[nodiscard]] bool LoadDemoConfig(const std::string& path, DemoConfig* outConfig, std::string* outError = nullptr);
[[nodiscard]] bool SaveDemoConfig(const std::string& path, const DemoConfig& config, std::string* outError = nullptr);

/// Understands --touch-emulation and --seed N.
[[nodiscard]] bool ApplyCommandLine(int argc, const char* const* argv, DemoConfig* config, std::string* outError = nullptr);
} // namespace demo::app
