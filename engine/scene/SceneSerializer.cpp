#include "engine/scene/SceneSerializer.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace engine::scene
{
namespace
{
using json = nlohmann::json;

json Vec3ToJson(const glm::vec3& value)
{
    return json::array({value.x, value.y, value.z});
}

glm::vec3 Vec3FromJson(const json& value, const glm::vec3& fallback)
{
    if (!value.is_array() || value.size() != 3)
    {
        return fallback;
    }
    return glm::vec3{
        value.at(0).get<float>(),
        value.at(1).get<float>(),
        value.at(2).get<float>(),
    };
}

// Stored w first, matching the glm::quat constructor.
json QuatToJson(const glm::quat& value)
{
    return json::array({value.w, value.x, value.y, value.z});
}

glm::quat QuatFromJson(const json& value)
{
    if (!value.is_array() || value.size() != 4)
    {
        return glm::quat{1.0F, 0.0F, 0.0F, 0.0F};
    }
    return glm::quat{
        value.at(0).get<float>(),
        value.at(1).get<float>(),
        value.at(2).get<float>(),
        value.at(3).get<float>(),
    };
}

std::string ShapeTypeToText(ShapeType type)
{
    switch (type)
    {
        case ShapeType::Capsule: return "capsule";
        case ShapeType::StaticMesh: return "static_mesh";
        case ShapeType::Box:
        default: return "box";
    }
}

ShapeType ShapeTypeFromText(const std::string& text)
{
    if (text == "capsule")
    {
        return ShapeType::Capsule;
    }
    if (text == "static_mesh")
    {
        return ShapeType::StaticMesh;
    }
    return ShapeType::Box;
}

std::string EventModeToText(CollisionEventMode mode)
{
    switch (mode)
    {
        case CollisionEventMode::Never: return "never";
        case CollisionEventMode::Always: return "always";
        case CollisionEventMode::WhenActive:
        default: return "when_active";
    }
}

CollisionEventMode EventModeFromText(const std::string& text)
{
    if (text == "never")
    {
        return CollisionEventMode::Never;
    }
    if (text == "always")
    {
        return CollisionEventMode::Always;
    }
    return CollisionEventMode::WhenActive;
}

json AnimationToJson(const animation::AnimationController& controller)
{
    json tracks = json::array();
    for (const animation::AnimationTrack& track : controller.Tracks())
    {
        tracks.push_back({
            {"clip", track.clip},
            {"layer", static_cast<int>(track.layer)},
            {"time", track.time},
            {"weight", track.weight},
            {"target_weight", track.targetWeight},
            {"fade_time", track.fadeTime},
            {"speed", track.speed},
            {"looped", track.looped},
        });
    }

    json lengths = json::object();
    for (const auto& [clip, seconds] : controller.ClipLengths())
    {
        lengths[clip] = seconds;
    }
    return json{{"tracks", tracks}, {"clip_lengths", lengths}};
}

animation::AnimationController AnimationFromJson(const json& value)
{
    animation::AnimationController controller;
    const json lengths = value.value("clip_lengths", json::object());
    for (auto it = lengths.begin(); it != lengths.end(); ++it)
    {
        controller.SetClipLength(it.key(), it.value().get<float>());
    }

    std::vector<animation::AnimationTrack> tracks;
    for (const json& item : value.value("tracks", json::array()))
    {
        animation::AnimationTrack track;
        track.clip = item.value("clip", std::string{});
        track.layer = static_cast<unsigned char>(item.value("layer", 0));
        track.time = item.value("time", 0.0F);
        track.weight = item.value("weight", 0.0F);
        track.targetWeight = item.value("target_weight", 1.0F);
        track.fadeTime = item.value("fade_time", 0.0F);
        track.speed = item.value("speed", 1.0F);
        track.looped = item.value("looped", true);
        if (!track.clip.empty())
        {
            tracks.push_back(track);
        }
    }
    controller.SetTracks(std::move(tracks));
    return controller;
}
} // namespace

nlohmann::json SceneSerializer::ToJson(const World& world)
{
    json root;
    root["format_version"] = kFormatVersion;
    root["next_entity"] = world.NextEntity();
    root["entities"] = json::array();

    for (const Entity entity : world.Entities())
    {
        json item;
        item["id"] = entity;

        if (const auto it = world.Names().find(entity); it != world.Names().end())
        {
            item["name"] = it->second.name;
        }
        if (const Transform* transform = world.FindTransform(entity); transform != nullptr)
        {
            item["transform"] = {
                {"position", Vec3ToJson(transform->position)},
                {"rotation", QuatToJson(transform->rotation)},
                {"scale", Vec3ToJson(transform->scale)},
            };
        }
        if (const auto it = world.Shapes().find(entity); it != world.Shapes().end())
        {
            item["shape"] = {
                {"type", ShapeTypeToText(it->second.type)},
                {"size", Vec3ToJson(it->second.size)},
                {"offset", Vec3ToJson(it->second.offset)},
                {"model", it->second.model},
            };
        }
        if (const RigidBody* body = world.FindBody(entity); body != nullptr)
        {
            item["body"] = {
                {"mass", body->mass},
                {"linear_velocity", Vec3ToJson(body->linearVelocity)},
                {"angular_factor", Vec3ToJson(body->angularFactor)},
                {"friction", body->friction},
                {"collision_layer", body->collisionLayer},
                {"collision_mask", body->collisionMask},
                {"collision_events", EventModeToText(body->collisionEvents)},
            };
        }
        if (const auto it = world.Renderables().find(entity); it != world.Renderables().end())
        {
            item["renderable"] = {
                {"model", it->second.model},
                {"color", Vec3ToJson(it->second.color)},
                {"cast_shadows", it->second.castShadows},
            };
        }
        if (const auto it = world.AnimatedModels().find(entity); it != world.AnimatedModels().end())
        {
            json bones = json::array();
            for (const Bone& bone : it->second.bones)
            {
                bones.push_back({
                    {"name", bone.name},
                    {"position", Vec3ToJson(bone.localPosition)},
                    {"rotation", QuatToJson(bone.localRotation)},
                    {"animated", bone.animated},
                });
            }
            item["animated_model"] = {{"model", it->second.model}, {"bones", bones}};
        }
        if (const auto it = world.Animations().find(entity); it != world.Animations().end())
        {
            item["animation"] = AnimationToJson(it->second);
        }
        if (const auto it = world.Lights().find(entity); it != world.Lights().end())
        {
            item["light"] = {
                {"direction", Vec3ToJson(it->second.direction)},
                {"color", Vec3ToJson(it->second.color)},
                {"brightness", it->second.brightness},
                {"cast_shadows", it->second.castShadows},
            };
        }
        if (const auto it = world.Zones().find(entity); it != world.Zones().end())
        {
            item["zone"] = {
                {"ambient_color", Vec3ToJson(it->second.ambientColor)},
                {"fog_color", Vec3ToJson(it->second.fogColor)},
                {"fog_start", it->second.fogStart},
                {"fog_end", it->second.fogEnd},
                {"bounds_min", Vec3ToJson(it->second.boundsMin)},
                {"bounds_max", Vec3ToJson(it->second.boundsMax)},
            };
        }

        root["entities"].push_back(item);
    }

    return root;
}

bool SceneSerializer::FromJson(const nlohmann::json& root, World* outWorld, std::string* outError)
{
    const int version = root.value("format_version", -1);
    if (version != kFormatVersion)
    {
        if (outError != nullptr)
        {
            std::ostringstream oss;
            oss << "Unsupported scene format version. Expected " << kFormatVersion << ", got " << version;
            *outError = oss.str();
        }
        return false;
    }

    World world;
    try
    {
        for (const json& item : root.value("entities", json::array()))
        {
            const Entity entity = item.at("id").get<Entity>();
            if (entity == kInvalidEntity)
            {
                continue;
            }
            world.ReserveEntity(entity);

            if (item.contains("name"))
            {
                world.Names()[entity] = NameComponent{item.at("name").get<std::string>()};
            }
            if (item.contains("transform"))
            {
                const json& value = item.at("transform");
                Transform transform;
                transform.position = Vec3FromJson(value.value("position", json::array()), glm::vec3{0.0F});
                transform.rotation = QuatFromJson(value.value("rotation", json::array()));
                transform.scale = Vec3FromJson(value.value("scale", json::array()), glm::vec3{1.0F});
                world.Transforms()[entity] = transform;
            }
            if (item.contains("shape"))
            {
                const json& value = item.at("shape");
                CollisionShape shape;
                shape.type = ShapeTypeFromText(value.value("type", std::string{"box"}));
                shape.size = Vec3FromJson(value.value("size", json::array()), glm::vec3{1.0F});
                shape.offset = Vec3FromJson(value.value("offset", json::array()), glm::vec3{0.0F});
                shape.model = value.value("model", std::string{});
                world.Shapes()[entity] = shape;
            }
            if (item.contains("body"))
            {
                const json& value = item.at("body");
                RigidBody body;
                body.mass = value.value("mass", 0.0F);
                body.linearVelocity = Vec3FromJson(value.value("linear_velocity", json::array()), glm::vec3{0.0F});
                body.angularFactor = Vec3FromJson(value.value("angular_factor", json::array()), glm::vec3{1.0F});
                body.friction = value.value("friction", 0.5F);
                body.collisionLayer = value.value("collision_layer", 1U);
                body.collisionMask = value.value("collision_mask", 0xFFFFU);
                body.collisionEvents = EventModeFromText(value.value("collision_events", std::string{"when_active"}));
                world.Bodies()[entity] = body;
            }
            if (item.contains("renderable"))
            {
                const json& value = item.at("renderable");
                Renderable renderable;
                renderable.model = value.value("model", std::string{});
                renderable.color = Vec3FromJson(value.value("color", json::array()), glm::vec3{0.8F});
                renderable.castShadows = value.value("cast_shadows", false);
                world.Renderables()[entity] = renderable;
            }
            if (item.contains("animated_model"))
            {
                const json& value = item.at("animated_model");
                AnimatedModel model;
                model.model = value.value("model", std::string{});
                for (const json& boneJson : value.value("bones", json::array()))
                {
                    Bone bone;
                    bone.name = boneJson.value("name", std::string{});
                    bone.localPosition = Vec3FromJson(boneJson.value("position", json::array()), glm::vec3{0.0F});
                    bone.localRotation = QuatFromJson(boneJson.value("rotation", json::array()));
                    bone.animated = boneJson.value("animated", true);
                    model.bones.push_back(bone);
                }
                world.AnimatedModels()[entity] = model;
            }
            if (item.contains("animation"))
            {
                world.Animations()[entity] = AnimationFromJson(item.at("animation"));
            }
            if (item.contains("light"))
            {
                const json& value = item.at("light");
                DirectionalLight light;
                light.direction = Vec3FromJson(value.value("direction", json::array()), glm::vec3{0.0F, -1.0F, 0.0F});
                light.color = Vec3FromJson(value.value("color", json::array()), glm::vec3{1.0F});
                light.brightness = value.value("brightness", 1.0F);
                light.castShadows = value.value("cast_shadows", false);
                world.Lights()[entity] = light;
            }
            if (item.contains("zone"))
            {
                const json& value = item.at("zone");
                Zone zone;
                zone.ambientColor = Vec3FromJson(value.value("ambient_color", json::array()), zone.ambientColor);
                zone.fogColor = Vec3FromJson(value.value("fog_color", json::array()), zone.fogColor);
                zone.fogStart = value.value("fog_start", zone.fogStart);
                zone.fogEnd = value.value("fog_end", zone.fogEnd);
                zone.boundsMin = Vec3FromJson(value.value("bounds_min", json::array()), zone.boundsMin);
                zone.boundsMax = Vec3FromJson(value.value("bounds_max", json::array()), zone.boundsMax);
                world.Zones()[entity] = zone;
            }
        }
        world.ReserveEntity(root.value("next_entity", Entity{1}) - 1);
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Invalid scene data: "} + ex.what();
        }
        return false;
    }

    *outWorld = std::move(world);
    return true;
}

bool SceneSerializer::SaveToFile(const World& world, const std::filesystem::path& path, std::string* outError)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            if (outError != nullptr)
            {
                *outError = "Unable to create directory " + path.parent_path().string() + ": " + ec.message();
            }
            return false;
        }
    }

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Unable to open file for writing: " + path.string();
        }
        return false;
    }

    stream << ToJson(world).dump(2) << "\n";
    return true;
}

bool SceneSerializer::LoadFromFile(const std::filesystem::path& path, World* outWorld, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Unable to open file: " + path.string();
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid JSON in " + path.string() + ": " + ex.what();
        }
        return false;
    }

    return FromJson(root, outWorld, outError);
}
} // namespace engine::scene
