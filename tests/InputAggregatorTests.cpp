#include <gtest/gtest.h>

#include <GLFW/glfw3.h>

#include "demo/camera/CameraRig.hpp"
#include "demo/character/Controls.hpp"
#include "demo/input/InputAggregator.hpp"
#include "demo/input/ScreenJoystick.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "tests/TestHelpers.hpp"

using demo::character::Controls;
using demo::input::AggregatorFrame;
using demo::input::AggregatorRequests;

namespace
{
class InputAggregatorTest : public ::testing::Test
{
protected:
    InputAggregatorTest()
        : m_aggregator(m_bindings)
    {
    }

    AggregatorRequests Update(const AggregatorFrame& frame = {})
    {
        return m_aggregator.Update(m_input, m_controls, m_rig, frame);
    }

    engine::platform::ActionBindings m_bindings;
    engine::platform::Input m_input;
    Controls m_controls;
    demo::camera::CameraRig m_rig;
    demo::input::InputAggregator m_aggregator;
};

engine::platform::TouchState MakeTouch(int id, const glm::vec2& from, const glm::vec2& to)
{
    engine::platform::TouchState touch;
    touch.id = id;
    touch.lastPosition = from;
    touch.position = to;
    touch.delta = to - from;
    return touch;
}
} // namespace

TEST_F(InputAggregatorTest, KeysMapToButtonsEachFrame)
{
    charsurf::test::PressKey(m_input, GLFW_KEY_W);
    m_input.SetKey(GLFW_KEY_D, true);
    m_input.SetKey(GLFW_KEY_SPACE, true);
    Update();

    EXPECT_TRUE(m_controls.IsDown(Controls::Forward));
    EXPECT_TRUE(m_controls.IsDown(Controls::Right));
    EXPECT_TRUE(m_controls.IsDown(Controls::Jump));
    EXPECT_FALSE(m_controls.IsDown(Controls::Back));

    charsurf::test::NextFrame(m_input);
    m_input.SetKey(GLFW_KEY_W, false);
    m_input.SetKey(GLFW_KEY_D, false);
    m_input.SetKey(GLFW_KEY_SPACE, false);
    Update();
    EXPECT_EQ(m_controls.buttons, 0U);
}

TEST_F(InputAggregatorTest, ArrowKeysAreSecondaryBindings)
{
    charsurf::test::PressKey(m_input, GLFW_KEY_DOWN);
    m_input.SetKey(GLFW_KEY_LEFT, true);
    Update();

    EXPECT_TRUE(m_controls.IsDown(Controls::Back));
    EXPECT_TRUE(m_controls.IsDown(Controls::Left));
}

TEST_F(InputAggregatorTest, MouseMovesYawAndPitch)
{
    charsurf::test::NextFrame(m_input);
    m_input.SetMouseDelta(glm::vec2{10.0F, 5.0F});
    Update();

    EXPECT_FLOAT_EQ(m_controls.yaw, 1.0F);
    EXPECT_FLOAT_EQ(m_controls.pitch, 0.5F);
}

TEST_F(InputAggregatorTest, PitchIsClamped)
{
    charsurf::test::NextFrame(m_input);
    m_input.SetMouseDelta(glm::vec2{0.0F, 5000.0F});
    Update();
    EXPECT_FLOAT_EQ(m_controls.pitch, demo::input::kPitchLimit);

    charsurf::test::NextFrame(m_input);
    m_input.SetMouseDelta(glm::vec2{0.0F, -10000.0F});
    Update();
    EXPECT_FLOAT_EQ(m_controls.pitch, -demo::input::kPitchLimit);
}

TEST_F(InputAggregatorTest, UiFocusBlocksControls)
{
    charsurf::test::PressKey(m_input, GLFW_KEY_W);
    m_input.SetKey(GLFW_KEY_F5, true);
    m_input.SetMouseDelta(glm::vec2{10.0F, 0.0F});

    AggregatorFrame frame;
    frame.uiHasFocus = true;
    const AggregatorRequests requests = Update(frame);

    EXPECT_EQ(m_controls.buttons, 0U);
    EXPECT_FLOAT_EQ(m_controls.yaw, 0.0F);
    EXPECT_FALSE(requests.saveScene);
}

TEST_F(InputAggregatorTest, FirstPersonTogglesOnPressOnly)
{
    charsurf::test::PressKey(m_input, GLFW_KEY_F);
    Update();
    EXPECT_TRUE(m_rig.IsFirstPerson());

    charsurf::test::NextFrame(m_input);
    Update();
    EXPECT_TRUE(m_rig.IsFirstPerson());

    charsurf::test::NextFrame(m_input);
    m_input.SetKey(GLFW_KEY_F, false);
    Update();
    charsurf::test::PressKey(m_input, GLFW_KEY_F);
    Update();
    EXPECT_FALSE(m_rig.IsFirstPerson());
}

TEST_F(InputAggregatorTest, SaveAndLoadRequests)
{
    charsurf::test::PressKey(m_input, GLFW_KEY_F5);
    AggregatorRequests requests = Update();
    EXPECT_TRUE(requests.saveScene);
    EXPECT_FALSE(requests.loadScene);

    charsurf::test::NextFrame(m_input);
    requests = Update();
    EXPECT_FALSE(requests.saveScene);

    charsurf::test::PressKey(m_input, GLFW_KEY_F7);
    requests = Update();
    EXPECT_TRUE(requests.loadScene);
}

TEST_F(InputAggregatorTest, GyroscopeNeedsTouch)
{
    EXPECT_FALSE(m_aggregator.SetUseGyroscope(true));
    charsurf::test::PressKey(m_input, GLFW_KEY_G);
    Update();
    EXPECT_FALSE(m_aggregator.Touch().UseGyroscope());

    m_aggregator.SetTouchEnabled(true);
    charsurf::test::NextFrame(m_input);
    m_input.SetKey(GLFW_KEY_G, false);
    Update();
    charsurf::test::PressKey(m_input, GLFW_KEY_G);
    Update();
    EXPECT_TRUE(m_aggregator.Touch().UseGyroscope());
}

TEST_F(InputAggregatorTest, TouchDragTurnsCameraInTouchMode)
{
    m_aggregator.SetTouchEnabled(true);
    charsurf::test::NextFrame(m_input);
    m_input.SetMouseDelta(glm::vec2{100.0F, 0.0F});
    m_input.SetTouches({MakeTouch(1, glm::vec2{300.0F, 300.0F}, glm::vec2{340.0F, 310.0F})});

    AggregatorFrame frame;
    frame.fovDegrees = 45.0F;
    frame.viewportHeight = 720.0F;
    Update(frame);

    const float scale = demo::input::kDefaultTouchSensitivity * 45.0F / 720.0F;
    EXPECT_FLOAT_EQ(m_controls.yaw, 40.0F * scale);
    EXPECT_FLOAT_EQ(m_controls.pitch, 10.0F * scale);
}

TEST_F(InputAggregatorTest, TouchesOverUiAreIgnored)
{
    m_aggregator.SetTouchEnabled(true);
    charsurf::test::NextFrame(m_input);
    m_input.SetTouches({MakeTouch(1, glm::vec2{300.0F, 300.0F}, glm::vec2{340.0F, 300.0F})});
    m_input.MarkTouchOverUi(0, true);
    Update();

    EXPECT_FLOAT_EQ(m_controls.yaw, 0.0F);
}

TEST_F(InputAggregatorTest, GyroscopeReplacesMovementKeys)
{
    m_aggregator.SetTouchEnabled(true);
    ASSERT_TRUE(m_aggregator.SetUseGyroscope(true));

    engine::platform::JoystickState gyro;
    gyro.connected = true;
    gyro.axes = {-0.5F, -0.5F};
    charsurf::test::PressKey(m_input, GLFW_KEY_D);
    m_input.SetJoystick(0, gyro);

    demo::input::ScreenJoystickState pad;
    pad.buttons = Controls::Back | Controls::Jump;
    AggregatorFrame frame;
    frame.screenJoystick = &pad;
    Update(frame);

    EXPECT_TRUE(m_controls.IsDown(Controls::Left));
    EXPECT_TRUE(m_controls.IsDown(Controls::Forward));
    EXPECT_FALSE(m_controls.IsDown(Controls::Right));
    EXPECT_FALSE(m_controls.IsDown(Controls::Back));
    EXPECT_TRUE(m_controls.IsDown(Controls::Jump));
}

TEST_F(InputAggregatorTest, ScreenJoystickAddsButtonsAndToggle)
{
    m_aggregator.SetTouchEnabled(true);
    charsurf::test::NextFrame(m_input);

    demo::input::ScreenJoystickState pad;
    pad.buttons = Controls::Forward | Controls::Left;
    pad.toggleFirstPerson = true;
    AggregatorFrame frame;
    frame.screenJoystick = &pad;
    Update(frame);

    EXPECT_TRUE(m_controls.IsDown(Controls::Forward));
    EXPECT_TRUE(m_controls.IsDown(Controls::Left));
    EXPECT_TRUE(m_rig.IsFirstPerson());
}
