#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace engine::core
{
struct FrameStats
{
    float frameMs = 0.0F;
    float fps = 0.0F;
    float avgFps = 0.0F;
    std::uint32_t drawCalls = 0;
    std::uint32_t triangles = 0;
    std::uint32_t physicsSteps = 0;
    // Section with the highest smoothed time, empty before the first EndFrame().
    std::string slowestSection;
    float slowestSectionMs = 0.0F;
};

/// Frame timing and named CPU sections shown by the debug HUD. Sections are
/// timed with CHARSURF_PROFILE_SCOPE; repeated scopes in one frame add up.
class Profiler
{
public:
    static constexpr std::size_t kFpsHistory = 120;

    static Profiler& Instance()
    {
        static Profiler s_instance;
        return s_instance;
    }

    void BeginFrame();
    void EndFrame();

    std::size_t OpenSection(std::string_view name);
    void CloseSection(std::size_t index);

    void RecordDrawCall(std::uint32_t triangles);
    void RecordPhysicsStep() { ++m_stats.physicsSteps; }

    [[nodiscard]] const FrameStats& Stats() const { return m_stats; }
    /// Smoothed milliseconds per frame, 0 for a section never timed.
    [[nodiscard]] float SectionAverageMs(std::string_view name) const;

private:
    using Clock = std::chrono::steady_clock;

    struct Section
    {
        std::string name;
        Clock::time_point openedAt{};
        float frameMs = 0.0F;
        float averageMs = 0.0F;
        bool timed = false;
    };

    Profiler() = default;

    Clock::time_point m_frameStart{};
    FrameStats m_stats{};
    std::array<float, kFpsHistory> m_fpsHistory{};
    std::size_t m_fpsCursor = 0;
    std::size_t m_fpsCount = 0;
    std::vector<Section> m_sections;
};

class ProfileScope
{
public:
    explicit ProfileScope(std::string_view name)
        : m_index(Profiler::Instance().OpenSection(name))
    {
    }
    ~ProfileScope() { Profiler::Instance().CloseSection(m_index); }

    ProfileScope(const ProfileScope&) = delete;
    ProfileScope& operator=(const ProfileScope&) = delete;

private:
    std::size_t m_index;
};

#define CHARSURF_PROFILE_JOIN_INNER(a, b) a##b
#define CHARSURF_PROFILE_JOIN(a, b) CHARSURF_PROFILE_JOIN_INNER(a, b)
#define CHARSURF_PROFILE_SCOPE(name) \
    ::engine::core::ProfileScope CHARSURF_PROFILE_JOIN(profileScope_, __LINE__)(name)
} // namespace engine::core
