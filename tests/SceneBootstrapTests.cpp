#include <gtest/gtest.h>

#include "demo/character/Character.hpp"
#include "demo/scene/SceneBootstrap.hpp"
#include "engine/core/Random.hpp"
#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"

namespace
{
struct BuiltScene
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics{world};
    demo::scene::SceneHandles handles;
};

void Build(BuiltScene& scene, std::uint32_t seed, const demo::scene::SceneBootstrapSettings& settings = {})
{
    engine::core::Random random(seed);
    demo::scene::RegisterCollisionParts(scene.physics);
    scene.handles = demo::scene::BuildScene(scene.world, scene.physics, random, settings);
}
} // namespace

TEST(SceneBootstrapTest, DefaultSceneContents)
{
    BuiltScene scene;
    Build(scene, 1U);

    EXPECT_EQ(scene.handles.mushrooms.size(), 60U);
    EXPECT_EQ(scene.handles.boxes.size(), 100U);
    EXPECT_EQ(scene.world.Zones().size(), 1U);
    EXPECT_EQ(scene.world.Lights().size(), 1U);

    // Floor plus three collision parts per mushroom.
    EXPECT_EQ(scene.physics.StaticSolidCount(), 1U + 3U * 60U);
    EXPECT_EQ(scene.physics.DynamicBodyCount(), 101U);

    const auto jack = scene.world.FindByName(demo::scene::kCharacterName);
    ASSERT_TRUE(jack.has_value());
    EXPECT_EQ(*jack, scene.handles.character);
}

TEST(SceneBootstrapTest, CharacterSetup)
{
    BuiltScene scene;
    Build(scene, 1U, demo::scene::SceneBootstrapSettings{0, 0});

    const engine::scene::Entity jack = scene.handles.character;
    EXPECT_FLOAT_EQ(scene.world.Transforms().at(jack).position.y, 1.0F);

    const engine::scene::RigidBody& body = scene.world.Bodies().at(jack);
    EXPECT_FLOAT_EQ(body.mass, 1.0F);
    EXPECT_EQ(body.collisionLayer, demo::scene::kCharacterLayer);
    EXPECT_EQ(body.collisionEvents, engine::scene::CollisionEventMode::Always);
    EXPECT_FLOAT_EQ(body.angularFactor.y, 0.0F);

    const engine::scene::CollisionShape& shape = scene.world.Shapes().at(jack);
    EXPECT_EQ(shape.type, engine::scene::ShapeType::Capsule);
    EXPECT_FLOAT_EQ(shape.size.x, 0.7F);
    EXPECT_FLOAT_EQ(shape.size.y, 1.8F);
    EXPECT_FLOAT_EQ(shape.offset.y, 0.9F);

    const engine::scene::Bone* head = scene.world.AnimatedModels().at(jack).FindBone("Bip01_Head");
    ASSERT_NE(head, nullptr);
    EXPECT_FALSE(head->animated);
    EXPECT_FLOAT_EQ(scene.world.Animations().at(jack).ClipLength(demo::character::Character::kWalkClip), 1.0F);
}

TEST(SceneBootstrapTest, ObjectsStayInsideArena)
{
    BuiltScene scene;
    Build(scene, 9U);

    for (const engine::scene::Entity mushroom : scene.handles.mushrooms)
    {
        const engine::scene::Transform& transform = scene.world.Transforms().at(mushroom);
        EXPECT_GE(transform.position.x, -90.0F);
        EXPECT_LT(transform.position.x, 90.0F);
        EXPECT_GE(transform.scale.x, 2.0F);
        EXPECT_LT(transform.scale.x, 7.0F);
        EXPECT_FALSE(scene.world.Bodies().at(mushroom).IsDynamic());
    }
    for (const engine::scene::Entity box : scene.handles.boxes)
    {
        const engine::scene::Transform& transform = scene.world.Transforms().at(box);
        EXPECT_GE(transform.position.y, 10.0F);
        EXPECT_LT(transform.position.y, 20.0F);
        EXPECT_FLOAT_EQ(scene.world.Bodies().at(box).mass, transform.scale.x * 2.0F);
    }
}

TEST(SceneBootstrapTest, SameSeedSameLayout)
{
    BuiltScene first;
    BuiltScene second;
    BuiltScene third;
    Build(first, 42U);
    Build(second, 42U);
    Build(third, 43U);

    const glm::vec3 a = first.world.Transforms().at(first.handles.boxes.back()).position;
    const glm::vec3 b = second.world.Transforms().at(second.handles.boxes.back()).position;
    const glm::vec3 c = third.world.Transforms().at(third.handles.boxes.back()).position;
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
