#include <gtest/gtest.h>

#include <vector>

#include "engine/physics/PhysicsWorld.hpp"
#include "engine/scene/World.hpp"

namespace
{
constexpr float kStep = 1.0F / 60.0F;
constexpr std::uint32_t kStaticLayer = 2U;

engine::scene::Entity AddFloor(engine::scene::World& world)
{
    const engine::scene::Entity floor = world.CreateEntity("Floor");
    engine::scene::Transform transform;
    transform.position = glm::vec3{0.0F, -0.5F, 0.0F};
    transform.scale = glm::vec3{200.0F, 1.0F, 200.0F};
    world.Transforms()[floor] = transform;
    world.Shapes()[floor] = engine::scene::CollisionShape{};
    engine::scene::RigidBody body;
    body.collisionLayer = kStaticLayer;
    world.Bodies()[floor] = body;
    return floor;
}

engine::scene::Entity AddBox(engine::scene::World& world, const glm::vec3& position, float mass = 1.0F)
{
    const engine::scene::Entity box = world.CreateEntity();
    engine::scene::Transform transform;
    transform.position = position;
    world.Transforms()[box] = transform;
    world.Shapes()[box] = engine::scene::CollisionShape{};
    engine::scene::RigidBody body;
    body.mass = mass;
    world.Bodies()[box] = body;
    return box;
}

void StepFor(engine::physics::PhysicsWorld& physics, float seconds)
{
    const int steps = static_cast<int>(seconds / kStep);
    for (int i = 0; i < steps; ++i)
    {
        physics.Step(kStep);
    }
}
} // namespace

TEST(PhysicsWorldTest, DynamicBoxSettlesOnFloor)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    AddFloor(world);
    const engine::scene::Entity box = AddBox(world, glm::vec3{0.0F, 5.0F, 0.0F});

    StepFor(physics, 3.0F);

    EXPECT_NEAR(world.Transforms().at(box).position.y, 0.5F, 0.02F);
    EXPECT_NEAR(physics.LinearVelocity(box).y, 0.0F, 0.25F);
}

TEST(PhysicsWorldTest, OffCenterContactLeavesRotationUnchanged)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    AddFloor(world);
    const engine::scene::Entity lower = AddBox(world, glm::vec3{0.0F, 0.5F, 0.0F});
    const engine::scene::Entity upper = AddBox(world, glm::vec3{0.6F, 3.0F, 0.0F});
    ASSERT_FLOAT_EQ(world.Bodies().at(upper).angularFactor.x, 1.0F);

    StepFor(physics, 2.0F);

    for (const engine::scene::Entity box : {lower, upper})
    {
        const glm::quat rotation = world.Transforms().at(box).rotation;
        EXPECT_FLOAT_EQ(rotation.w, 1.0F);
        EXPECT_FLOAT_EQ(rotation.x, 0.0F);
        EXPECT_FLOAT_EQ(rotation.z, 0.0F);
    }
}

TEST(PhysicsWorldTest, CapsuleFeetRestOnFloor)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    AddFloor(world);

    const engine::scene::Entity capsule = world.CreateEntity("Capsule");
    engine::scene::Transform transform;
    transform.position = glm::vec3{0.0F, 1.0F, 0.0F};
    world.Transforms()[capsule] = transform;
    engine::scene::CollisionShape shape;
    shape.type = engine::scene::ShapeType::Capsule;
    shape.size = glm::vec3{0.7F, 1.8F, 0.7F};
    shape.offset = glm::vec3{0.0F, 0.9F, 0.0F};
    world.Shapes()[capsule] = shape;
    engine::scene::RigidBody body;
    body.mass = 1.0F;
    world.Bodies()[capsule] = body;

    StepFor(physics, 2.0F);

    EXPECT_NEAR(world.Transforms().at(capsule).position.y, 0.0F, 0.02F);
}

TEST(PhysicsWorldTest, CollisionEventNormalPointsAtReceiver)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    const engine::scene::Entity floor = AddFloor(world);
    const engine::scene::Entity box = AddBox(world, glm::vec3{0.0F, 0.6F, 0.0F});

    std::vector<engine::physics::CollisionEvent> events;
    (void)physics.SubscribeCollision(box, [&events](const engine::physics::CollisionEvent& event) {
        events.push_back(event);
    });

    StepFor(physics, 0.5F);

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().body, box);
    EXPECT_EQ(events.front().other, floor);
    ASSERT_FALSE(events.front().contacts.empty());
    EXPECT_GT(events.front().contacts.front().normal.y, 0.75F);
}

TEST(PhysicsWorldTest, StaticBodiesDoNotReceiveEventsWhenActiveOnly)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    const engine::scene::Entity floor = AddFloor(world);
    AddBox(world, glm::vec3{0.0F, 0.6F, 0.0F});

    int floorEvents = 0;
    (void)physics.SubscribeCollision(floor, [&floorEvents](const engine::physics::CollisionEvent&) { ++floorEvents; });

    StepFor(physics, 0.5F);
    EXPECT_EQ(floorEvents, 0);

    world.Bodies().at(floor).collisionEvents = engine::scene::CollisionEventMode::Always;
    StepFor(physics, 0.1F);
    EXPECT_GT(floorEvents, 0);
}

TEST(PhysicsWorldTest, RaycastRespectsLayerMask)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    const engine::scene::Entity floor = AddFloor(world);

    const engine::physics::Ray ray{glm::vec3{0.0F, 10.0F, 0.0F}, glm::vec3{0.0F, -1.0F, 0.0F}};
    const auto hit = physics.RaycastSingle(ray, 50.0F, kStaticLayer);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->entity, floor);
    EXPECT_NEAR(hit->distance, 10.0F, 1.0e-3F);
    EXPECT_GT(hit->normal.y, 0.99F);

    EXPECT_FALSE(physics.RaycastSingle(ray, 50.0F, 1U).has_value());
    EXPECT_FALSE(physics.RaycastSingle(ray, 5.0F, kStaticLayer).has_value());
}

TEST(PhysicsWorldTest, RaycastStartingInsideBodyIgnoresIt)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    AddFloor(world);

    const engine::physics::Ray ray{glm::vec3{0.0F, -0.25F, 0.0F}, glm::vec3{0.0F, -1.0F, 0.0F}};
    EXPECT_FALSE(physics.RaycastSingle(ray, 10.0F, kStaticLayer).has_value());
}

TEST(PhysicsWorldTest, RaycastHitsNearestDynamicBody)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    AddFloor(world);
    const engine::scene::Entity box = AddBox(world, glm::vec3{0.0F, 3.0F, 0.0F});

    const engine::physics::Ray ray{glm::vec3{0.0F, 10.0F, 0.0F}, glm::vec3{0.0F, -1.0F, 0.0F}};
    const auto hit = physics.RaycastSingle(ray, 50.0F, 0xFFFFU);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->entity, box);
    EXPECT_NEAR(hit->distance, 6.5F, 1.0e-3F);
}

TEST(PhysicsWorldTest, StaticMeshUsesRegisteredParts)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    AddFloor(world);

    const engine::scene::Entity mesh = world.CreateEntity("Mushroom");
    world.Transforms()[mesh] = engine::scene::Transform{glm::vec3{4.0F, 0.0F, 4.0F}};
    engine::scene::CollisionShape shape;
    shape.type = engine::scene::ShapeType::StaticMesh;
    shape.model = "Mushroom";
    world.Shapes()[mesh] = shape;
    world.Bodies()[mesh] = engine::scene::RigidBody{};

    physics.RegisterMeshParts(
        "Mushroom",
        {
            engine::physics::CollisionPart{glm::vec3{0.0F, 1.0F, 0.0F}, glm::vec3{0.2F, 1.0F, 0.2F}},
            engine::physics::CollisionPart{glm::vec3{0.0F, 2.2F, 0.0F}, glm::vec3{1.0F, 0.2F, 1.0F}},
            engine::physics::CollisionPart{glm::vec3{0.0F, 2.6F, 0.0F}, glm::vec3{0.6F, 0.2F, 0.6F}},
        }
    );

    EXPECT_EQ(physics.StaticSolidCount(), 4U);
    EXPECT_EQ(physics.DynamicBodyCount(), 0U);

    const engine::physics::Ray ray{glm::vec3{4.0F, 10.0F, 4.0F}, glm::vec3{0.0F, -1.0F, 0.0F}};
    const auto hit = physics.RaycastSingle(ray, 20.0F, 0xFFFFU);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->entity, mesh);
    EXPECT_NEAR(hit->position.y, 2.8F, 1.0e-3F);
}

TEST(PhysicsWorldTest, MaskedBodyFallsThroughFloor)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    AddFloor(world);
    const engine::scene::Entity box = AddBox(world, glm::vec3{0.0F, 2.0F, 0.0F});
    world.Bodies().at(box).collisionMask = 1U;

    StepFor(physics, 1.5F);

    EXPECT_LT(world.Transforms().at(box).position.y, -1.0F);
}

TEST(PhysicsWorldTest, DynamicBoxesStack)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    AddFloor(world);
    const engine::scene::Entity lower = AddBox(world, glm::vec3{0.0F, 0.5F, 0.0F});
    const engine::scene::Entity upper = AddBox(world, glm::vec3{0.0F, 1.8F, 0.0F});

    StepFor(physics, 2.0F);

    const float lowerY = world.Transforms().at(lower).position.y;
    const float upperY = world.Transforms().at(upper).position.y;
    EXPECT_GT(upperY, lowerY + 0.8F);
    EXPECT_GT(lowerY, 0.3F);
}

TEST(PhysicsWorldTest, ImpulseOnlyMovesDynamicBodies)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    const engine::scene::Entity floor = AddFloor(world);
    const engine::scene::Entity box = AddBox(world, glm::vec3{0.0F, 3.0F, 0.0F}, 2.0F);

    physics.ApplyImpulse(box, glm::vec3{4.0F, 0.0F, 0.0F});
    physics.ApplyImpulse(floor, glm::vec3{4.0F, 0.0F, 0.0F});

    EXPECT_FLOAT_EQ(physics.LinearVelocity(box).x, 2.0F);
    EXPECT_FLOAT_EQ(physics.LinearVelocity(floor).x, 0.0F);
}

TEST(PhysicsWorldTest, PreStepHandlersRunUntilUnsubscribed)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);

    int calls = 0;
    float lastStep = 0.0F;
    const std::size_t token = physics.SubscribePreStep([&](float timeStep) {
        ++calls;
        lastStep = timeStep;
    });

    physics.Step(kStep);
    physics.Step(kStep);
    EXPECT_EQ(calls, 2);
    EXPECT_FLOAT_EQ(lastStep, kStep);

    physics.UnsubscribePreStep(token);
    physics.Step(kStep);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(physics.StepCount(), 3U);
}

TEST(PhysicsWorldTest, ZeroStepDoesNothing)
{
    engine::scene::World world;
    engine::physics::PhysicsWorld physics(world);
    const engine::scene::Entity box = AddBox(world, glm::vec3{0.0F, 3.0F, 0.0F});

    physics.Step(0.0F);

    EXPECT_EQ(physics.StepCount(), 0U);
    EXPECT_FLOAT_EQ(world.Transforms().at(box).position.y, 3.0F);
}
