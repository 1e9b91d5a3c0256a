#include "engine/render/RenderQuality.hpp"

#include <sstream>

namespace engine::render
{
int NextQualityLevel(int level)
{
    ++level;
    if (level > 2 || level < 0)
    {
        level = 0;
    }
    return level;
}

int NextShadowMapSize(int size)
{
    size *= 2;
    if (size > kMaxShadowMapSize || size < kMinShadowMapSize)
    {
        size = kMinShadowMapSize;
    }
    return size;
}

int NextShadowQuality(int quality)
{
    ++quality;
    if (quality > kMaxShadowQuality || quality < 0)
    {
        quality = 0;
    }
    return quality;
}

int ToggleOccluderTriangles(int triangles)
{
    return triangles > 0 ? 0 : kDefaultOccluderTriangles;
}

bool OcclusionEnabled(const RenderQuality& quality)
{
    return quality.maxOccluderTriangles > 0;
}

std::string DescribeQuality(const RenderQuality& quality)
{
    std::ostringstream oss;
    oss << "texture=" << quality.textureQuality
        << " material=" << quality.materialQuality
        << " specular=" << (quality.specularLighting ? "on" : "off")
        << " shadows=" << (quality.drawShadows ? "on" : "off")
        << " shadow_map=" << quality.shadowMapSize
        << " shadow_quality=" << quality.shadowQuality
        << " occlusion=" << (OcclusionEnabled(quality) ? "on" : "off")
        << " instancing=" << (quality.dynamicInstancing ? "on" : "off");
    return oss.str();
}
} // namespace engine::render
