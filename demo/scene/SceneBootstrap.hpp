#pragma once

#include <cstdint>
#include <vector>

#include "engine/scene/Components.hpp"

namespace engine::core
{
class Random;
}

namespace engine::physics
{
class PhysicsWorld;
}

namespace engine::scene
{
class World;
}

namespace demo::scene
{
struct SceneBootstrapSettings
{
    int mushroomCount = 60;
    int boxCount = 100;
};

struct SceneHandles
{
    engine::scene::Entity zone = engine::scene::kInvalidEntity;
    engine::scene::Entity light = engine::scene::kInvalidEntity;
    engine::scene::Entity floor = engine::scene::kInvalidEntity;
    engine::scene::Entity character = engine::scene::kInvalidEntity;
    std::vector<engine::scene::Entity> mushrooms;
    std::vector<engine::scene::Entity> boxes;
};

constexpr const char* kCharacterName = "Jack";
constexpr const char* kFloorModel = "Models/Box.mdl";
constexpr const char* kBoxModel = "Models/Box.mdl";
constexpr const char* kMushroomModel = "Models/Mushroom.mdl";
constexpr const char* kCharacterModel = "Models/Jack.mdl";
constexpr float kWalkClipLength = 1.0F;
constexpr float kCameraFarClip = 300.0F;
// Character bodies live on layer 1, the rest of the scene on layer 2.
constexpr std::uint32_t kCharacterLayer = 1U;
constexpr std::uint32_t kSceneLayer = 2U;

/// Collision approximation of the mushroom model, registered once per physics world.
void RegisterCollisionParts(engine::physics::PhysicsWorld& physics);

/// Zone, light, floor, mushrooms, falling boxes and the character.
SceneHandles BuildScene(
    engine::scene::World& world,
    engine::physics::PhysicsWorld& physics,
    engine::core::Random& random,
    const SceneBootstrapSettings& settings = {}
);
} // namespace demo::scene
