#pragma once

#include <cstdint>
#include <random>

namespace engine::core
{
class Random
{
public:
    explicit Random(std::uint32_t seed = 0);

    void Seed(std::uint32_t seed);
    [[nodiscard]] std::uint32_t SeedValue() const { return m_seed; }

    /// [0, 1)
    float NextRandom();
    /// [0, range]
    float NextRandom(float range);
    /// [min, max]
    float NextRandom(float min, float max);
    /// [min, max - 1]
    int NextRandom(int min, int max);

private:
    std::mt19937 m_rng;
    std::uint32_t m_seed = 0;
};
} // namespace engine::core
