#include "engine/core/Random.hpp"

namespace engine::core
{
Random::Random(std::uint32_t seed)
{
    Seed(seed);
}

void Random::Seed(std::uint32_t seed)
{
    // Zero means "pick one".
    m_seed = seed != 0 ? seed : std::random_device{}();
    m_rng.seed(m_seed);
}

float Random::NextRandom()
{
    std::uniform_real_distribution<float> dist(0.0F, 1.0F);
    float value = dist(m_rng);
    // Some standard libraries can return the upper bound for float.
    if (value >= 1.0F)
    {
        value = 0.0F;
    }
    return value;
}

float Random::NextRandom(float range)
{
    return NextRandom() * range;
}

float Random::NextRandom(float min, float max)
{
    return NextRandom() * (max - min) + min;
}

int Random::NextRandom(int min, int max)
{
    if (max <= min)
    {
        return min;
    }
    std::uniform_int_distribution<int> dist(min, max - 1);
    return dist(m_rng);
}
} // namespace engine::core
