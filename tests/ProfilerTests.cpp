#include <gtest/gtest.h>

#include "engine/core/Profiler.hpp"

using engine::core::Profiler;

TEST(ProfilerTest, CountersResetEachFrame)
{
    Profiler& profiler = Profiler::Instance();
    profiler.BeginFrame();
    profiler.RecordDrawCall(12);
    profiler.RecordDrawCall(3);
    profiler.RecordPhysicsStep();
    profiler.EndFrame();
    EXPECT_EQ(profiler.Stats().drawCalls, 2U);
    EXPECT_EQ(profiler.Stats().triangles, 15U);
    EXPECT_EQ(profiler.Stats().physicsSteps, 1U);

    profiler.BeginFrame();
    profiler.EndFrame();
    EXPECT_EQ(profiler.Stats().drawCalls, 0U);
    EXPECT_EQ(profiler.Stats().physicsSteps, 0U);
}

TEST(ProfilerTest, ScopedSectionIsReported)
{
    Profiler& profiler = Profiler::Instance();
    EXPECT_FLOAT_EQ(profiler.SectionAverageMs("ProfilerTest::Never"), 0.0F);

    profiler.BeginFrame();
    {
        CHARSURF_PROFILE_SCOPE("ProfilerTest::Work");
        volatile int sink = 0;
        for (int i = 0; i < 100000; ++i)
        {
            sink = sink + i;
        }
    }
    profiler.EndFrame();

    EXPECT_GE(profiler.SectionAverageMs("ProfilerTest::Work"), 0.0F);
    EXPECT_FALSE(profiler.Stats().slowestSection.empty());
    EXPECT_GT(profiler.Stats().avgFps, 0.0F);
}
