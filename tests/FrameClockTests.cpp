#include <gtest/gtest.h>

#include "engine/core/FrameClock.hpp"

namespace
{
int RunSteps(engine::core::FrameClock& clock)
{
    int steps = 0;
    while (clock.ShouldRunFixedStep())
    {
        clock.ConsumeFixedStep();
        ++steps;
    }
    return steps;
}
} // namespace

TEST(FrameClockTest, FirstFrameHasNoDelta)
{
    engine::core::FrameClock clock;
    clock.BeginFrame(10.0);
    EXPECT_DOUBLE_EQ(clock.DeltaSeconds(), 0.0);
    EXPECT_FALSE(clock.ShouldRunFixedStep());
}

TEST(FrameClockTest, AccumulatesFixedSteps)
{
    engine::core::FrameClock clock(1.0 / 60.0, 5);
    clock.Advance(2.5 / 60.0);
    EXPECT_EQ(RunSteps(clock), 2);

    // Half a step carried over completes one more.
    clock.Advance(0.6 / 60.0);
    EXPECT_EQ(RunSteps(clock), 1);
}

TEST(FrameClockTest, CapsStepsPerFrame)
{
    engine::core::FrameClock clock(1.0 / 60.0, 3);
    clock.Advance(0.2);
    EXPECT_EQ(RunSteps(clock), 3);
    EXPECT_EQ(clock.StepsThisFrame(), 3);

    clock.Advance(0.0);
    EXPECT_LE(RunSteps(clock), 1);
}

TEST(FrameClockTest, ClampsLongStalls)
{
    engine::core::FrameClock clock;
    clock.Advance(5.0);
    EXPECT_DOUBLE_EQ(clock.DeltaSeconds(), 0.25);
}

TEST(FrameClockTest, FixedHzIsClamped)
{
    engine::core::FrameClock clock;
    clock.SetFixedHz(30);
    EXPECT_DOUBLE_EQ(clock.FixedDeltaSeconds(), 1.0 / 30.0);
    clock.SetFixedHz(1000);
    EXPECT_DOUBLE_EQ(clock.FixedDeltaSeconds(), 1.0 / 240.0);
    clock.SetFixedHz(0);
    EXPECT_DOUBLE_EQ(clock.FixedDeltaSeconds(), 1.0 / 60.0);
}
