#pragma once

namespace engine::core
{
/// Variable render delta plus fixed physics step accumulator.
class FrameClock
{
public:
    explicit FrameClock(double fixedDeltaSeconds = 1.0 / 60.0, int maxStepsPerFrame = 5);

    void SetFixedHz(int hz);
    void SetFixedDeltaSeconds(double fixedDeltaSeconds);

    void BeginFrame(double nowSeconds);
    void Advance(double deltaSeconds);

    [[nodiscard]] bool ShouldRunFixedStep() const;
    void ConsumeFixedStep();

    [[nodiscard]] double DeltaSeconds() const { return m_deltaSeconds; }
    [[nodiscard]] double FixedDeltaSeconds() const { return m_fixedDeltaSeconds; }
    [[nodiscard]] double ElapsedSeconds() const { return m_elapsedSeconds; }
    [[nodiscard]] int StepsThisFrame() const { return m_stepsThisFrame; }
    [[nodiscard]] unsigned long long FrameIndex() const { return m_frameIndex; }

private:
    double m_fixedDeltaSeconds;
    double m_deltaSeconds = 0.0;
    double m_elapsedSeconds = 0.0;
    double m_lastNowSeconds = 0.0;
    double m_accumulator = 0.0;
    int m_maxStepsPerFrame;
    int m_stepsThisFrame = 0;
    unsigned long long m_frameIndex = 0;
    bool m_hasLastNow = false;
};
} // namespace engine::core
