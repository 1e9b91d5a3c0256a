#include <gtest/gtest.h>

#include <cmath>

#include <glm/gtc/quaternion.hpp>

#include "demo/camera/CameraRig.hpp"
#include "demo/character/Character.hpp"
#include "demo/scene/SceneBootstrap.hpp"
#include "engine/core/Random.hpp"

using demo::camera::CameraRig;

namespace
{
class CameraRigTest : public ::testing::Test
{
protected:
    CameraRigTest()
        : m_physics(m_world)
        , m_random(3U)
    {
        m_handles = demo::scene::BuildScene(m_world, m_physics, m_random, demo::scene::SceneBootstrapSettings{0, 0});
        m_world.Transforms().at(m_handles.character).position = glm::vec3{0.0F};
    }

    engine::scene::Entity AddWall(const glm::vec3& center, const glm::vec3& size, std::uint32_t layer)
    {
        const engine::scene::Entity wall = m_world.CreateEntity("Wall");
        m_world.Transforms()[wall].position = center;
        engine::scene::CollisionShape shape;
        shape.size = size;
        m_world.Shapes()[wall] = shape;
        engine::scene::RigidBody body;
        body.collisionLayer = layer;
        m_world.Bodies()[wall] = body;
        m_physics.MarkStaticsDirty();
        return wall;
    }

    void Update() { m_rig.Update(m_world, m_physics, m_handles.character, m_controls); }

    engine::scene::World m_world;
    engine::physics::PhysicsWorld m_physics;
    engine::core::Random m_random;
    demo::scene::SceneHandles m_handles;
    demo::character::Controls m_controls;
    CameraRig m_rig;
};
} // namespace

TEST(CameraRigDistanceTest, ZoomClampsToRange)
{
    CameraRig rig;
    EXPECT_FLOAT_EQ(rig.Distance(), demo::camera::kCameraInitialDistance);

    rig.ApplyZoom(-10.0F);
    EXPECT_FLOAT_EQ(rig.Distance(), demo::camera::kCameraMinDistance);

    rig.ApplyZoom(3.5F);
    EXPECT_FLOAT_EQ(rig.Distance(), 4.5F);

    rig.SetDistance(100.0F);
    EXPECT_FLOAT_EQ(rig.Distance(), demo::camera::kCameraMaxDistance);
}

TEST_F(CameraRigTest, ThirdPersonSitsBehindAimPoint)
{
    Update();

    EXPECT_FLOAT_EQ(m_rig.EffectiveDistance(), demo::camera::kCameraInitialDistance);
    EXPECT_NEAR(m_rig.Pose().position.x, 0.0F, 1.0e-4F);
    EXPECT_NEAR(m_rig.Pose().position.y, 1.7F, 1.0e-4F);
    EXPECT_NEAR(m_rig.Pose().position.z, 5.0F, 1.0e-4F);
    EXPECT_NEAR(m_rig.Pose().Forward().z, -1.0F, 1.0e-4F);
}

TEST_F(CameraRigTest, PitchDownRaisesCamera)
{
    m_controls.pitch = 30.0F;
    Update();

    EXPECT_NEAR(m_rig.Pose().position.y, 1.7F + 2.5F, 1.0e-3F);
    EXPECT_LT(m_rig.Pose().Forward().y, 0.0F);
}

TEST_F(CameraRigTest, WallPullsCameraIn)
{
    AddWall(glm::vec3{0.0F, 2.0F, 3.0F}, glm::vec3{10.0F, 10.0F, 1.0F}, demo::scene::kSceneLayer);
    Update();

    EXPECT_NEAR(m_rig.EffectiveDistance(), 2.5F, 1.0e-3F);
    EXPECT_FLOAT_EQ(m_rig.Distance(), demo::camera::kCameraInitialDistance);
    EXPECT_NEAR(m_rig.Pose().position.z, 2.5F, 1.0e-3F);
}

TEST_F(CameraRigTest, CollisionNeverPullsInsideMinimum)
{
    AddWall(glm::vec3{0.0F, 2.0F, 0.8F}, glm::vec3{10.0F, 10.0F, 0.5F}, demo::scene::kSceneLayer);
    Update();

    EXPECT_FLOAT_EQ(m_rig.EffectiveDistance(), demo::camera::kCameraMinDistance);
}

TEST_F(CameraRigTest, CharacterLayerDoesNotBlockCamera)
{
    AddWall(glm::vec3{0.0F, 2.0F, 3.0F}, glm::vec3{10.0F, 10.0F, 1.0F}, demo::scene::kCharacterLayer);
    Update();

    EXPECT_FLOAT_EQ(m_rig.EffectiveDistance(), demo::camera::kCameraInitialDistance);
}

TEST_F(CameraRigTest, LookingUpStopsAtFloor)
{
    m_controls.pitch = -45.0F;
    Update();

    EXPECT_NEAR(m_rig.EffectiveDistance(), 1.7F * std::sqrt(2.0F), 1.0e-3F);
    EXPECT_GE(m_rig.Pose().position.y, -1.0e-3F);
}

TEST_F(CameraRigTest, HeadPitchIsLimited)
{
    m_controls.pitch = 80.0F;
    Update();

    const engine::scene::Bone* head =
        m_world.AnimatedModels().at(m_handles.character).FindBone(demo::character::Character::kHeadBone);
    ASSERT_NE(head, nullptr);
    EXPECT_NEAR(glm::degrees(glm::angle(head->localRotation)), demo::camera::kHeadPitchLimit, 1.0e-3F);
}

TEST_F(CameraRigTest, FirstPersonUsesHeadPosition)
{
    m_rig.SetFirstPerson(true);
    m_controls.yaw = 90.0F;
    m_world.Transforms().at(m_handles.character).rotation = demo::character::YawRotation(m_controls.yaw);
    Update();

    EXPECT_NEAR(m_rig.Pose().position.y, 1.75F, 1.0e-4F);
    EXPECT_NEAR(m_rig.Pose().position.x, 0.2F, 1.0e-4F);
    EXPECT_NEAR(m_rig.Pose().Forward().x, 1.0F, 1.0e-4F);

    m_rig.ToggleFirstPerson();
    EXPECT_FALSE(m_rig.IsFirstPerson());
}
