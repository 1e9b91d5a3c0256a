#include "engine/core/Profiler.hpp"

#include <algorithm>
#include <numeric>

namespace engine::core
{
namespace
{
// Weight of the newest frame in a section's running average.
constexpr float kSectionSmoothing = 0.1F;
} // namespace

void Profiler::BeginFrame()
{
    m_frameStart = Clock::now();
    m_stats.drawCalls = 0;
    m_stats.triangles = 0;
    m_stats.physicsSteps = 0;
    for (Section& section : m_sections)
    {
        section.frameMs = 0.0F;
    }
}

void Profiler::EndFrame()
{
    const float frameMs = std::chrono::duration<float, std::milli>(Clock::now() - m_frameStart).count();
    m_stats.frameMs = frameMs;
    m_stats.fps = frameMs > 0.001F ? 1000.0F / frameMs : 0.0F;

    m_fpsHistory[m_fpsCursor] = m_stats.fps;
    m_fpsCursor = (m_fpsCursor + 1) % kFpsHistory;
    m_fpsCount = std::min(m_fpsCount + 1, kFpsHistory);
    const float fpsSum = std::accumulate(m_fpsHistory.begin(), m_fpsHistory.begin() + static_cast<std::ptrdiff_t>(m_fpsCount), 0.0F);
    m_stats.avgFps = fpsSum / static_cast<float>(m_fpsCount);

    m_stats.slowestSection.clear();
    m_stats.slowestSectionMs = 0.0F;
    for (Section& section : m_sections)
    {
        section.averageMs = section.timed ? section.averageMs + (section.frameMs - section.averageMs) * kSectionSmoothing : section.frameMs;
        section.timed = true;
        if (section.averageMs > m_stats.slowestSectionMs || m_stats.slowestSection.empty())
        {
            m_stats.slowestSection = section.name;
            m_stats.slowestSectionMs = section.averageMs;
        }
    }
}

std::size_t Profiler::OpenSection(std::string_view name)
{
    auto it = std::find_if(m_sections.begin(), m_sections.end(), [name](const Section& section) {
        return section.name == name;
    });
    if (it == m_sections.end())
    {
        Section section;
        section.name = std::string(name);
        m_sections.push_back(section);
        it = m_sections.end() - 1;
    }
    it->openedAt = Clock::now();
    return static_cast<std::size_t>(it - m_sections.begin());
}

void Profiler::CloseSection(std::size_t index)
{
    if (index >= m_sections.size())
    {
        return;
    }
    Section& section = m_sections[index];
    section.frameMs += std::chrono::duration<float, std::milli>(Clock::now() - section.openedAt).count();
}

void Profiler::RecordDrawCall(std::uint32_t triangles)
{
    ++m_stats.drawCalls;
    m_stats.triangles += triangles;
}

float Profiler::SectionAverageMs(std::string_view name) const
{
    for (const Section& section : m_sections)
    {
        if (section.name == name)
        {
            return section.averageMs;
        }
    }
    return 0.0F;
}
} // namespace engine::core
