#include "demo/scene/SceneBootstrap.hpp"

#include <string>

#include <glm/trigonometric.hpp>

#include "demo/character/Character.hpp"
#include "engine/core/Random.hpp"
#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"

namespace demo::scene
{
using engine::scene::Entity;

void RegisterCollisionParts(engine::physics::PhysicsWorld& physics)
{
    // Unit height model: stem, wide cap rim, narrow cap top.
    physics.RegisterMeshParts(
        kMushroomModel,
        {
            engine::physics::CollisionPart{glm::vec3{0.0F, 0.275F, 0.0F}, glm::vec3{0.11F, 0.275F, 0.11F}},
            engine::physics::CollisionPart{glm::vec3{0.0F, 0.6F, 0.0F}, glm::vec3{0.4F, 0.1F, 0.4F}},
            engine::physics::CollisionPart{glm::vec3{0.0F, 0.75F, 0.0F}, glm::vec3{0.2F, 0.08F, 0.2F}},
        }
    );
}

SceneHandles BuildScene(
    engine::scene::World& world,
    engine::physics::PhysicsWorld& physics,
    engine::core::Random& random,
    const SceneBootstrapSettings& settings
)
{
    SceneHandles handles;

    handles.zone = world.CreateEntity("Zone");
    world.Transforms()[handles.zone] = engine::scene::Transform{};
    engine::scene::Zone& zone = world.Zones()[handles.zone];
    zone.ambientColor = glm::vec3{0.15F, 0.15F, 0.15F};
    zone.fogColor = glm::vec3{0.5F, 0.5F, 0.7F};
    zone.fogStart = 100.0F;
    zone.fogEnd = 300.0F;
    zone.boundsMin = glm::vec3{-1000.0F};
    zone.boundsMax = glm::vec3{1000.0F};

    handles.light = world.CreateEntity("DirectionalLight");
    world.Transforms()[handles.light] = engine::scene::Transform{};
    engine::scene::DirectionalLight& light = world.Lights()[handles.light];
    light.direction = glm::vec3{0.3F, -0.5F, 0.425F};
    light.castShadows = true;

    handles.floor = world.CreateEntity("Floor");
    engine::scene::Transform& floorTransform = world.Transforms()[handles.floor];
    floorTransform.position = glm::vec3{0.0F, -0.5F, 0.0F};
    floorTransform.scale = glm::vec3{200.0F, 1.0F, 200.0F};
    world.Renderables()[handles.floor] = engine::scene::Renderable{kFloorModel, glm::vec3{0.45F, 0.45F, 0.42F}, false};
    engine::scene::RigidBody floorBody;
    floorBody.collisionLayer = kSceneLayer;
    world.Bodies()[handles.floor] = floorBody;
    world.Shapes()[handles.floor] = engine::scene::CollisionShape{engine::scene::ShapeType::Box, glm::vec3{1.0F}, glm::vec3{0.0F}, {}};

    for (int i = 0; i < settings.mushroomCount; ++i)
    {
        const Entity mushroom = world.CreateEntity("Mushroom");
        engine::scene::Transform& transform = world.Transforms()[mushroom];
        transform.position = glm::vec3{random.NextRandom(180.0F) - 90.0F, 0.0F, random.NextRandom(180.0F) - 90.0F};
        transform.rotation = glm::angleAxis(glm::radians(random.NextRandom(360.0F)), glm::vec3{0.0F, 1.0F, 0.0F});
        transform.scale = glm::vec3{2.0F + random.NextRandom(5.0F)};

        world.Renderables()[mushroom] = engine::scene::Renderable{kMushroomModel, glm::vec3{0.78F, 0.22F, 0.18F}, true};
        engine::scene::RigidBody body;
        body.collisionLayer = kSceneLayer;
        world.Bodies()[mushroom] = body;
        world.Shapes()[mushroom] = engine::scene::CollisionShape{engine::scene::ShapeType::StaticMesh, glm::vec3{1.0F}, glm::vec3{0.0F}, kMushroomModel};
        handles.mushrooms.push_back(mushroom);
    }

    for (int i = 0; i < settings.boxCount; ++i)
    {
        const float scale = random.NextRandom(2.0F) + 0.5F;
        const Entity box = world.CreateEntity("Box");
        engine::scene::Transform& transform = world.Transforms()[box];
        transform.position = glm::vec3{random.NextRandom(180.0F) - 90.0F, random.NextRandom(10.0F) + 10.0F, random.NextRandom(180.0F) - 90.0F};
        const glm::vec3 euler{
            glm::radians(random.NextRandom(360.0F)),
            glm::radians(random.NextRandom(360.0F)),
            glm::radians(random.NextRandom(360.0F)),
        };
        transform.rotation = glm::quat(euler);
        transform.scale = glm::vec3{scale};

        world.Renderables()[box] = engine::scene::Renderable{kBoxModel, glm::vec3{0.62F, 0.48F, 0.3F}, true};
        engine::scene::RigidBody body;
        body.mass = scale * 2.0F;
        body.collisionLayer = kSceneLayer;
        world.Bodies()[box] = body;
        world.Shapes()[box] = engine::scene::CollisionShape{engine::scene::ShapeType::Box, glm::vec3{1.0F}, glm::vec3{0.0F}, {}};
        handles.boxes.push_back(box);
    }

    handles.character = world.CreateEntity(kCharacterName);
    engine::scene::Transform& characterTransform = world.Transforms()[handles.character];
    characterTransform.position = glm::vec3{0.0F, 1.0F, 0.0F};
    world.Renderables()[handles.character] = engine::scene::Renderable{kCharacterModel, glm::vec3{0.25F, 0.45F, 0.75F}, true};

    engine::scene::AnimatedModel& model = world.AnimatedModels()[handles.character];
    model.model = kCharacterModel;
    // The head is posed by the camera rig, not by clips.
    model.bones.push_back(engine::scene::Bone{character::Character::kHeadBone, glm::vec3{0.0F, 1.6F, 0.0F}, glm::quat{1.0F, 0.0F, 0.0F, 0.0F}, false});

    engine::animation::AnimationController& animation = world.Animations()[handles.character];
    animation.SetClipLength(character::Character::kWalkClip, kWalkClipLength);

    engine::scene::RigidBody characterBody;
    characterBody.mass = 1.0F;
    characterBody.angularFactor = glm::vec3{0.0F};
    characterBody.collisionLayer = kCharacterLayer;
    characterBody.collisionEvents = engine::scene::CollisionEventMode::Always;
    world.Bodies()[handles.character] = characterBody;
    world.Shapes()[handles.character] = engine::scene::CollisionShape{
        engine::scene::ShapeType::Capsule,
        glm::vec3{0.7F, 1.8F, 0.7F},
        glm::vec3{0.0F, 0.9F, 0.0F},
        {},
    };

    physics.MarkStaticsDirty();
    return handles;
}
} // namespace demo::scene
