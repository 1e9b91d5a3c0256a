#include "demo/app/SampleHost.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <utility>
#include <vector>

#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"

namespace demo::app
{
using engine::platform::InputAction;

SampleHost::SampleHost(std::string sampleName)
    : m_sampleName(std::move(sampleName))
{
}

HostActions SampleHost::HandleKeys(
    const engine::platform::Input& input,
    const engine::platform::ActionBindings& bindings,
    engine::render::RenderQuality& quality,
    bool consoleOpen,
    bool uiHasFocus
)
{
    HostActions actions;

    if (bindings.IsPressed(input, InputAction::Exit))
    {
        if (consoleOpen)
        {
            actions.toggleConsole = true;
        }
        else
        {
            actions.exitRequested = true;
        }
        return actions;
    }

    if (bindings.IsPressed(input, InputAction::ToggleConsole))
    {
        actions.toggleConsole = true;
    }
    if (bindings.IsPressed(input, InputAction::ToggleDebugHud))
    {
        m_debugHudVisible = !m_debugHudVisible;
    }

    if (uiHasFocus)
    {
        return actions;
    }

    if (bindings.IsPressed(input, InputAction::CycleTextureQuality))
    {
        quality.textureQuality = engine::render::NextQualityLevel(quality.textureQuality);
        actions.qualityChanged = true;
    }
    if (bindings.IsPressed(input, InputAction::CycleMaterialQuality))
    {
        quality.materialQuality = engine::render::NextQualityLevel(quality.materialQuality);
        actions.qualityChanged = true;
    }
    if (bindings.IsPressed(input, InputAction::ToggleSpecular))
    {
        quality.specularLighting = !quality.specularLighting;
        actions.qualityChanged = true;
    }
    if (bindings.IsPressed(input, InputAction::ToggleShadows))
    {
        quality.drawShadows = !quality.drawShadows;
        actions.qualityChanged = true;
    }
    if (bindings.IsPressed(input, InputAction::CycleShadowMapSize))
    {
        quality.shadowMapSize = engine::render::NextShadowMapSize(quality.shadowMapSize);
        actions.qualityChanged = true;
    }
    if (bindings.IsPressed(input, InputAction::CycleShadowQuality))
    {
        quality.shadowQuality = engine::render::NextShadowQuality(quality.shadowQuality);
        actions.qualityChanged = true;
    }
    if (bindings.IsPressed(input, InputAction::ToggleOcclusion))
    {
        quality.maxOccluderTriangles = engine::render::ToggleOccluderTriangles(quality.maxOccluderTriangles);
        actions.qualityChanged = true;
    }
    if (bindings.IsPressed(input, InputAction::ToggleInstancing))
    {
        quality.dynamicInstancing = !quality.dynamicInstancing;
        actions.qualityChanged = true;
    }
    if (bindings.IsPressed(input, InputAction::Screenshot))
    {
        actions.screenshotRequested = true;
    }

    return actions;
}

std::string SampleHost::ScreenshotPath(const std::string& dataPath, std::chrono::system_clock::time_point when) const
{
    const std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm localTm{};
#ifdef _WIN32
    localtime_s(&localTm, &time);
#else
    localtime_r(&time, &localTm);
#endif
    char timeBuffer[64]{};
    std::strftime(timeBuffer, sizeof(timeBuffer), "%Y-%m-%d-%H-%M-%S", &localTm);

    std::string prefix = dataPath.empty() ? std::string{"Data"} : dataPath;
    if (prefix.back() != '/')
    {
        prefix += '/';
    }
    return prefix + "Screenshot_" + m_sampleName + "_" + timeBuffer + ".png";
}

void SampleHost::DrawInstructions(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport) const
{
    std::istringstream lines(kInstructions);
    std::string line;
    const float lineHeight = ui.LineHeight(0.9F);
    float y = viewport.y + viewport.h * 0.5F - lineHeight * 1.5F;
    const glm::vec4 shadow{0.0F, 0.0F, 0.0F, 0.7F};
    while (std::getline(lines, line))
    {
        const float width = ui.TextWidth(line, 0.9F);
        const float x = viewport.x + (viewport.w - width) * 0.5F;
        ui.DrawTextLabel(x + 1.0F, y + 1.0F, line, shadow, 0.9F);
        ui.DrawTextLabel(x, y, line, ui.Theme().colorText, 0.9F);
        y += lineHeight;
    }
}

void SampleHost::DrawDebugHud(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport, const DebugHudInfo& info) const
{
    if (!m_debugHudVisible)
    {
        return;
    }

    char buffer[160]{};
    std::vector<std::string> rows;
    std::snprintf(buffer, sizeof(buffer), "Frame %.2f ms  FPS %.0f (avg %.0f)", info.stats.frameMs, info.stats.fps, info.stats.avgFps);
    rows.emplace_back(buffer);
    std::snprintf(buffer, sizeof(buffer), "Draw calls %u  Triangles %u  Physics steps %u", info.stats.drawCalls, info.stats.triangles, info.stats.physicsSteps);
    rows.emplace_back(buffer);
    if (!info.stats.slowestSection.empty())
    {
        std::snprintf(buffer, sizeof(buffer), "Slowest %s %.2f ms", info.stats.slowestSection.c_str(), info.stats.slowestSectionMs);
        rows.emplace_back(buffer);
    }
    std::snprintf(buffer, sizeof(buffer), "Bodies %zu dynamic, %zu static solids", info.dynamicBodies, info.staticSolids);
    rows.emplace_back(buffer);
    std::snprintf(buffer, sizeof(buffer), "Character %s  air %.2f s", character::CharacterStateToText(info.characterState), info.inAirTime);
    rows.emplace_back(buffer);
    std::snprintf(
        buffer,
        sizeof(buffer),
        "Camera %s  distance %.2f  touch %s  gyro %s",
        info.firstPerson ? "1st" : "3rd",
        info.cameraDistance,
        info.touchEnabled ? "on" : "off",
        info.gyroscope ? "on" : "off"
    );
    rows.emplace_back(buffer);
    rows.push_back(engine::render::DescribeQuality(info.quality));

    const float lineHeight = ui.LineHeight(0.75F);
    float width = 0.0F;
    for (const std::string& row : rows)
    {
        width = std::max(width, ui.TextWidth(row, 0.75F));
    }
    const engine::ui::UiRect panel{viewport.x + 8.0F, viewport.y + 8.0F, width + 16.0F, lineHeight * static_cast<float>(rows.size()) + 12.0F};
    glm::vec4 background = ui.Theme().colorPanel;
    background.a = 0.6F;
    ui.DrawRect(panel, background);

    float y = panel.y + 6.0F;
    for (const std::string& row : rows)
    {
        ui.DrawTextLabel(panel.x + 8.0F, y, row, ui.Theme().colorText, 0.75F);
        y += lineHeight;
    }
}
} // namespace demo::app
