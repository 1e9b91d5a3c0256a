#include "demo/app/DemoSettings.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace demo::app
{
namespace
{
using json = nlohmann::json;

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}

enum class ReadResult
{
    Missing,
    Failed,
    Loaded
};

ReadResult ReadJsonFile(const std::string& path, json* outValue, std::string* outError)
{
    if (!std::filesystem::exists(path))
    {
        return ReadResult::Missing;
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Unable to open file: " + path);
        return ReadResult::Failed;
    }

    try
    {
        stream >> *outValue;
    }
    catch (const std::exception& ex)
    {
        SetError(outError, "Invalid JSON in " + path + ": " + ex.what());
        return ReadResult::Failed;
    }

    if (!outValue->is_object())
    {
        SetError(outError, "Expected a JSON object in " + path);
        return ReadResult::Failed;
    }
    return ReadResult::Loaded;
}

bool WriteJsonFile(const std::string& path, const json& value, std::string* outError)
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Unable to open file for writing: " + path);
        return false;
    }

    stream << value.dump(2) << "\n";
    return true;
}

template <typename T>
void ReadNumber(const json& root, const char* key, T* outValue)
{
    if (root.contains(key) && root[key].is_number())
    {
        *outValue = root[key].get<T>();
    }
}

void ReadBool(const json& root, const char* key, bool* outValue)
{
    if (root.contains(key) && root[key].is_boolean())
    {
        *outValue = root[key].get<bool>();
    }
}
} // namespace

bool LoadControlsSettings(const std::string& path, ControlsSettings* outSettings, std::string* outError)
{
    ControlsSettings settings;
    json root;
    switch (ReadJsonFile(path, &root, outError))
    {
        case ReadResult::Missing:
            *outSettings = settings;
            return SaveControlsSettings(path, settings, outError);
        case ReadResult::Failed:
            *outSettings = settings;
            return false;
        case ReadResult::Loaded:
            break;
    }

    ReadNumber(root, "yaw_sensitivity", &settings.yawSensitivity);
    ReadNumber(root, "touch_sensitivity", &settings.touchSensitivity);
    settings.yawSensitivity = std::max(0.0F, settings.yawSensitivity);
    settings.touchSensitivity = std::max(0.0F, settings.touchSensitivity);
    *outSettings = settings;
    return true;
}

bool SaveControlsSettings(const std::string& path, const ControlsSettings& settings, std::string* outError)
{
    // Bindings live in the same document.
    json root = json::object();
    json existing;
    if (ReadJsonFile(path, &existing, nullptr) == ReadResult::Loaded)
    {
        root = std::move(existing);
    }

    root["asset_version"] = settings.assetVersion;
    root["yaw_sensitivity"] = settings.yawSensitivity;
    root["touch_sensitivity"] = settings.touchSensitivity;
    return WriteJsonFile(path, root, outError);
}

bool LoadGraphicsSettings(const std::string& path, GraphicsSettings* outSettings, std::string* outError)
{
    GraphicsSettings settings;
    json root;
    switch (ReadJsonFile(path, &root, outError))
    {
        case ReadResult::Missing:
            *outSettings = settings;
            return SaveGraphicsSettings(path, settings, outError);
        case ReadResult::Failed:
            *outSettings = settings;
            return false;
        case ReadResult::Loaded:
            break;
    }

    ReadNumber(root, "width", &settings.width);
    ReadNumber(root, "height", &settings.height);
    ReadBool(root, "fullscreen", &settings.fullscreen);
    ReadBool(root, "vsync", &settings.vsync);
    ReadNumber(root, "fps_limit", &settings.fpsLimit);

    engine::render::RenderQuality& quality = settings.quality;
    ReadNumber(root, "texture_quality", &quality.textureQuality);
    ReadNumber(root, "material_quality", &quality.materialQuality);
    ReadBool(root, "specular_lighting", &quality.specularLighting);
    ReadBool(root, "draw_shadows", &quality.drawShadows);
    ReadNumber(root, "shadow_map_size", &quality.shadowMapSize);
    ReadNumber(root, "shadow_quality", &quality.shadowQuality);
    ReadNumber(root, "max_occluder_triangles", &quality.maxOccluderTriangles);
    ReadBool(root, "dynamic_instancing", &quality.dynamicInstancing);

    settings.width = std::max(640, settings.width);
    settings.height = std::max(360, settings.height);
    settings.fpsLimit = std::max(0, settings.fpsLimit);
    quality.textureQuality = std::clamp(quality.textureQuality, 0, 2);
    quality.materialQuality = std::clamp(quality.materialQuality, 0, 2);
    quality.shadowMapSize = std::clamp(quality.shadowMapSize, engine::render::kMinShadowMapSize, engine::render::kMaxShadowMapSize);
    quality.shadowQuality = std::clamp(quality.shadowQuality, 0, engine::render::kMaxShadowQuality);
    quality.maxOccluderTriangles = std::max(0, quality.maxOccluderTriangles);

    *outSettings = settings;
    return true;
}

bool SaveGraphicsSettings(const std::string& path, const GraphicsSettings& settings, std::string* outError)
{
    const engine::render::RenderQuality& quality = settings.quality;
    json root;
    root["asset_version"] = settings.assetVersion;
    root["width"] = settings.width;
    root["height"] = settings.height;
    root["fullscreen"] = settings.fullscreen;
    root["vsync"] = settings.vsync;
    root["fps_limit"] = settings.fpsLimit;
    root["texture_quality"] = quality.textureQuality;
    root["material_quality"] = quality.materialQuality;
    root["specular_lighting"] = quality.specularLighting;
    root["draw_shadows"] = quality.drawShadows;
    root["shadow_map_size"] = quality.shadowMapSize;
    root["shadow_quality"] = quality.shadowQuality;
    root["max_occluder_triangles"] = quality.maxOccluderTriangles;
    root["dynamic_instancing"] = quality.dynamicInstancing;
    return WriteJsonFile(path, root, outError);
}

bool LoadDemoConfig(const std::string& path, DemoConfig* outConfig, std::string* outError)
{
    DemoConfig config;
    json root;
    switch (ReadJsonFile(path, &root, outError))
    {
        case ReadResult::Missing:
            *outConfig = config;
            return SaveDemoConfig(path, config, outError);
        case ReadResult::Failed:
            *outConfig = config;
            return false;
        case ReadResult::Loaded:
            break;
    }

    ReadBool(root, "touch_emulation", &config.touchEmulation);
    if (root.contains("random_seed") && root["random_seed"].is_number_unsigned())
    {
        config.randomSeed = root["random_seed"].get<std::uint32_t>();
    }
    ReadNumber(root, "mushroom_count", &config.mushroomCount);
    ReadNumber(root, "box_count", &config.boxCount);
    ReadNumber(root, "fixed_hz", &config.fixedHz);
    if (root.contains("platform") && root["platform"].is_string())
    {
        config.platform = root["platform"].get<std::string>();
    }

    config.mushroomCount = std::max(0, config.mushroomCount);
    config.boxCount = std::max(0, config.boxCount);
    config.fixedHz = std::clamp(config.fixedHz, 10, 240);
    *outConfig = config;
    return true;
}

bool SaveDemoConfig(const std::string& path, const DemoConfig& config, std::string* outError)
{
    json root;
    root["asset_version"] = config.assetVersion;
    root["touch_emulation"] = config.touchEmulation;
    root["random_seed"] = config.randomSeed;
    root["mushroom_count"] = config.mushroomCount;
    root["box_count"] = config.boxCount;
    root["fixed_hz"] = config.fixedHz;
    root["platform"] = config.platform;
    return WriteJsonFile(path, root, outError);
}

bool ApplyCommandLine(int argc, const char* const* argv, DemoConfig* config, std::string* outError)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string argument = argv[i];
        if (argument == "--touch-emulation")
        {
            config->touchEmulation = true;
        }
        else if (argument == "--seed")
        {
            if (i + 1 >= argc)
            {
                SetError(outError, "--seed expects a value");
                return false;
            }
            const std::string value = argv[++i];
            try
            {
                std::size_t consumed = 0;
                const unsigned long seed = std::stoul(value, &consumed);
                if (consumed != value.size() || value.front() == '-')
                {
                    SetError(outError, "Invalid seed: " + value);
                    return false;
                }
                config->randomSeed = static_cast<std::uint32_t>(seed);
            }
            catch (const std::exception&)
            {
                SetError(outError, "Invalid seed: " + value);
                return false;
            }
        }
        else
        {
            SetError(outError, "Unknown argument: " + argument);
            return false;
        }
    }
    return true;
}
} // namespace demo::app
