#include <gtest/gtest.h>

#include "engine/core/Random.hpp"

using engine::core::Random;

TEST(RandomTest, SameSeedSameSequence)
{
    Random a(1234U);
    Random b(1234U);
    for (int i = 0; i < 32; ++i)
    {
        EXPECT_FLOAT_EQ(a.NextRandom(), b.NextRandom());
    }
    EXPECT_EQ(a.SeedValue(), 1234U);
}

TEST(RandomTest, ZeroSeedPicksOne)
{
    Random random(0U);
    EXPECT_NE(random.SeedValue(), 0U);
}

TEST(RandomTest, RangesHold)
{
    Random random(7U);
    for (int i = 0; i < 1000; ++i)
    {
        const float unit = random.NextRandom();
        EXPECT_GE(unit, 0.0F);
        EXPECT_LT(unit, 1.0F);

        const float ranged = random.NextRandom(180.0F);
        EXPECT_GE(ranged, 0.0F);
        EXPECT_LE(ranged, 180.0F);

        const float between = random.NextRandom(-2.0F, 3.0F);
        EXPECT_GE(between, -2.0F);
        EXPECT_LE(between, 3.0F);

        const int integer = random.NextRandom(1, 4);
        EXPECT_GE(integer, 1);
        EXPECT_LE(integer, 3);
    }
}

TEST(RandomTest, EmptyIntegerRangeReturnsMin)
{
    Random random(7U);
    EXPECT_EQ(random.NextRandom(5, 5), 5);
    EXPECT_EQ(random.NextRandom(5, 2), 5);
}
