#pragma once

#include <string>

namespace demo::pages
{
/// Name of the platform this binary was built for ("Android", "iOS",
/// "Windows", "macOS", "Linux").
[[nodiscard]] std::string CurrentPlatform();
[[nodiscard]] bool IsMobilePlatform(const std::string& platform);

/// Resource directory prefix for |platform|. Empty means the default "Data".
[[nodiscard]] std::string ResolveDataPath(const std::string& platform);
/// ResolveDataPath with the empty case replaced by "Data".
[[nodiscard]] std::string EffectiveDataPath(const std::string& platform);
} // namespace demo::pages
