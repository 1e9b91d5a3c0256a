#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "engine/scene/World.hpp"

namespace engine::scene
{
/// Full world snapshot as JSON. Entity ids are preserved so references held by
/// name or id resolve the same way after a reload.
class SceneSerializer
{
public:
    static constexpr int kFormatVersion = 1;

    [[nodiscard]] static nlohmann::json ToJson(const World& world);
    /// On failure |outWorld| is left untouched.
    [[nodiscard]] static bool FromJson(const nlohmann::json& root, World* outWorld, std::string* outError = nullptr);

    /// Creates missing parent directories.
    [[nodiscard]] static bool SaveToFile(const World& world, const std::filesystem::path& path, std::string* outError = nullptr);
    [[nodiscard]] static bool LoadFromFile(const std::filesystem::path& path, World* outWorld, std::string* outError = nullptr);
};
} // namespace engine::scene
