#include "engine/core/FrameClock.hpp"

#include <algorithm>

namespace engine::core
{
FrameClock::FrameClock(double fixedDeltaSeconds, int maxStepsPerFrame)
    : m_fixedDeltaSeconds(fixedDeltaSeconds)
    , m_maxStepsPerFrame(std::max(1, maxStepsPerFrame))
{
}

void FrameClock::SetFixedHz(int hz)
{
    SetFixedDeltaSeconds(hz > 0 ? 1.0 / static_cast<double>(hz) : 1.0 / 60.0);
}

void FrameClock::SetFixedDeltaSeconds(double fixedDeltaSeconds)
{
    m_fixedDeltaSeconds = std::clamp(fixedDeltaSeconds, 1.0 / 240.0, 1.0 / 15.0);
    m_accumulator = std::min(m_accumulator, m_fixedDeltaSeconds * 2.0);
}

void FrameClock::BeginFrame(double nowSeconds)
{
    if (!m_hasLastNow)
    {
        m_lastNowSeconds = nowSeconds;
        m_hasLastNow = true;
    }

    const double delta = nowSeconds - m_lastNowSeconds;
    m_lastNowSeconds = nowSeconds;
    Advance(delta);
}

void FrameClock::Advance(double deltaSeconds)
{
    // Long stalls (debugger, window drag) are not replayed.
    m_deltaSeconds = std::clamp(deltaSeconds, 0.0, 0.25);
    m_elapsedSeconds += m_deltaSeconds;
    m_accumulator += m_deltaSeconds;
    m_stepsThisFrame = 0;
    ++m_frameIndex;
}

bool FrameClock::ShouldRunFixedStep() const
{
    return m_accumulator >= m_fixedDeltaSeconds && m_stepsThisFrame < m_maxStepsPerFrame;
}

void FrameClock::ConsumeFixedStep()
{
    m_accumulator = std::max(0.0, m_accumulator - m_fixedDeltaSeconds);
    ++m_stepsThisFrame;
    if (m_stepsThisFrame >= m_maxStepsPerFrame)
    {
        // Drop the backlog instead of spiralling.
        m_accumulator = std::min(m_accumulator, m_fixedDeltaSeconds);
    }
}
} // namespace engine::core
