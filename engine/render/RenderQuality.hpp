#pragma once

#include <string>

namespace engine::render
{
/// Quality knobs toggled at runtime by the number keys.
struct RenderQuality
{
    // 0 low, 1 medium, 2 high.
    int textureQuality = 2;
    int materialQuality = 2;
    bool specularLighting = true;
    bool drawShadows = true;
    int shadowMapSize = 1024;
    // 0..3, higher is smoother.
    int shadowQuality = 2;
    int maxOccluderTriangles = 5000;
    bool dynamicInstancing = true;
};

constexpr int kMinShadowMapSize = 512;
constexpr int kMaxShadowMapSize = 2048;
constexpr int kMaxShadowQuality = 3;
constexpr int kDefaultOccluderTriangles = 5000;

/// 0 -> 1 -> 2 -> 0
[[nodiscard]] int NextQualityLevel(int level);
/// Doubles, wrapping past 2048 back to 512.
[[nodiscard]] int NextShadowMapSize(int size);
[[nodiscard]] int NextShadowQuality(int quality);
/// 5000 <-> 0
[[nodiscard]] int ToggleOccluderTriangles(int triangles);

[[nodiscard]] bool OcclusionEnabled(const RenderQuality& quality);
[[nodiscard]] std::string DescribeQuality(const RenderQuality& quality);
} // namespace engine::render
