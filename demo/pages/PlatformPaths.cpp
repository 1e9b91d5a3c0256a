#include "demo/pages/PlatformPaths.hpp"

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

namespace demo::pages
{
std::string CurrentPlatform()
{
#if defined(__ANDROID__)
    return "Android";
#elif defined(__APPLE__)
#if TARGET_OS_IPHONE
    return "iOS";
#else
    return "macOS";
#endif
#elif defined(_WIN32)
    return "Windows";
#else
    return "Linux";
#endif
}

bool IsMobilePlatform(const std::string& platform)
{
    return platform == "Android" || platform == "iOS";
}

std::string ResolveDataPath(const std::string& platform)
{
    if (platform == "Android")
    {
        return "Data";
    }
    if (platform == "UWP" || platform == "WinPhone" || platform == "WinRT" || platform == "Windows")
    {
        return "Assets/Data";
    }
    if (platform == "iOS")
    {
        return "Data";
    }
    return {};
}

std::string EffectiveDataPath(const std::string& platform)
{
    const std::string path = ResolveDataPath(platform);
    return path.empty() ? std::string{"Data"} : path;
}
} // namespace demo::pages
