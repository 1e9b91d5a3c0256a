#include <gtest/gtest.h>

#include "demo/camera/CameraRig.hpp"
#include "demo/character/Controls.hpp"
#include "demo/input/ScreenJoystick.hpp"
#include "demo/input/TouchControls.hpp"
#include "engine/platform/Input.hpp"

using demo::character::Controls;
using demo::input::TouchControls;
using engine::platform::TouchState;

namespace
{
TouchState MakeTouch(int id, float fromY, float toY)
{
    TouchState touch;
    touch.id = id;
    touch.lastPosition = glm::vec2{400.0F, fromY};
    touch.position = glm::vec2{400.0F, toY};
    touch.delta = touch.position - touch.lastPosition;
    return touch;
}

TouchState MakeTap(int id, const glm::vec2& position)
{
    TouchState touch;
    touch.id = id;
    touch.position = position;
    touch.lastPosition = position;
    return touch;
}

engine::platform::JoystickState MakeGyroscope(float x, float y)
{
    engine::platform::JoystickState state;
    state.connected = true;
    state.axes = {x, y};
    return state;
}
} // namespace

TEST(TouchControlsTest, SpreadingFingersZoomsIn)
{
    const TouchControls touch;
    const auto delta = touch.ZoomDelta(MakeTouch(1, 100.0F, 90.0F), MakeTouch(2, 200.0F, 210.0F));
    ASSERT_TRUE(delta.has_value());
    EXPECT_FLOAT_EQ(*delta, -20.0F * demo::input::kDefaultTouchSensitivity / 50.0F);
}

TEST(TouchControlsTest, PinchingZoomsOut)
{
    const TouchControls touch;
    const auto delta = touch.ZoomDelta(MakeTouch(1, 90.0F, 100.0F), MakeTouch(2, 210.0F, 200.0F));
    ASSERT_TRUE(delta.has_value());
    EXPECT_GT(*delta, 0.0F);
}

TEST(TouchControlsTest, ParallelOrUiTouchesDoNotZoom)
{
    const TouchControls touch;
    EXPECT_FALSE(touch.ZoomDelta(MakeTouch(1, 100.0F, 110.0F), MakeTouch(2, 200.0F, 210.0F)).has_value());

    TouchState overUi = MakeTouch(2, 200.0F, 210.0F);
    overUi.overUiElement = true;
    EXPECT_FALSE(touch.ZoomDelta(MakeTouch(1, 100.0F, 90.0F), overUi).has_value());
}

TEST(TouchControlsTest, UpdateAppliesZoomToRig)
{
    TouchControls touch;
    engine::platform::Input input;
    demo::camera::CameraRig rig;
    Controls controls;

    input.BeginSnapshot();
    input.SetTouches({MakeTouch(1, 90.0F, 100.0F), MakeTouch(2, 210.0F, 200.0F)});
    touch.Update(input, controls, rig);

    EXPECT_TRUE(touch.IsZooming());
    EXPECT_FLOAT_EQ(rig.Distance(), demo::camera::kCameraInitialDistance + 0.8F);

    input.BeginSnapshot();
    touch.Update(input, controls, rig);
    EXPECT_FALSE(touch.IsZooming());
}

TEST(TouchControlsTest, ZoomRespectsDistanceLimits)
{
    TouchControls touch(200.0F);
    engine::platform::Input input;
    demo::camera::CameraRig rig;
    Controls controls;

    input.BeginSnapshot();
    input.SetTouches({MakeTouch(1, 100.0F, 50.0F), MakeTouch(2, 200.0F, 250.0F)});
    touch.Update(input, controls, rig);

    EXPECT_FLOAT_EQ(rig.Distance(), demo::camera::kCameraMinDistance);
}

TEST(TouchControlsTest, GyroscopeTiltSetsButtons)
{
    TouchControls touch;
    touch.SetUseGyroscope(true);
    engine::platform::Input input;
    demo::camera::CameraRig rig;
    Controls controls;

    input.SetJoystick(0, MakeGyroscope(0.4F, 0.3F));
    touch.Update(input, controls, rig);
    EXPECT_TRUE(controls.IsDown(Controls::Right));
    EXPECT_TRUE(controls.IsDown(Controls::Back));
    EXPECT_FALSE(controls.IsDown(Controls::Left));
    EXPECT_FALSE(controls.IsDown(Controls::Forward));
}

TEST(TouchControlsTest, SmallTiltIsIgnored)
{
    TouchControls touch;
    touch.SetUseGyroscope(true);
    engine::platform::Input input;
    demo::camera::CameraRig rig;
    Controls controls;

    input.SetJoystick(0, MakeGyroscope(0.05F, -0.05F));
    touch.Update(input, controls, rig);
    EXPECT_EQ(controls.buttons, 0U);
}

TEST(TouchControlsTest, GyroscopeOffIgnoresTilt)
{
    TouchControls touch;
    engine::platform::Input input;
    demo::camera::CameraRig rig;
    Controls controls;

    input.SetJoystick(0, MakeGyroscope(-1.0F, -1.0F));
    touch.Update(input, controls, rig);
    EXPECT_EQ(controls.buttons, 0U);
}

TEST(ScreenJoystickTest, PadPushedUpWalksForward)
{
    demo::input::ScreenJoystick joystick;
    joystick.Layout(engine::ui::UiRect{0.0F, 0.0F, 1280.0F, 720.0F}, 1.0F);

    engine::platform::Input input;
    input.BeginSnapshot();
    input.SetTouches({MakeTap(1, glm::vec2{114.0F, 540.0F}), MakeTap(2, glm::vec2{640.0F, 300.0F})});
    const demo::input::ScreenJoystickState state = joystick.Update(input, glm::vec2{1.0F});

    EXPECT_EQ(state.buttons, Controls::Forward);
    EXPECT_LT(state.axes.y, -demo::input::ScreenJoystick::kAxisDeadZone);
    EXPECT_TRUE(input.Touch(0).overUiElement);
    EXPECT_FALSE(input.Touch(1).overUiElement);
}

TEST(ScreenJoystickTest, ButtonsJumpAndToggleOnce)
{
    demo::input::ScreenJoystick joystick;
    joystick.Layout(engine::ui::UiRect{0.0F, 0.0F, 1280.0F, 720.0F}, 1.0F);
    const engine::ui::UiRect jump = joystick.JumpButtonRect();
    const engine::ui::UiRect toggle = joystick.FirstPersonButtonRect();

    engine::platform::Input input;
    input.BeginSnapshot();
    input.SetTouches({
        MakeTap(1, glm::vec2{jump.x + jump.w * 0.5F, jump.y + jump.h * 0.5F}),
        MakeTap(2, glm::vec2{toggle.x + toggle.w * 0.5F, toggle.y + toggle.h * 0.5F}),
    });

    demo::input::ScreenJoystickState state = joystick.Update(input, glm::vec2{1.0F});
    EXPECT_EQ(state.buttons, Controls::Jump);
    EXPECT_TRUE(state.toggleFirstPerson);

    input.BeginSnapshot();
    state = joystick.Update(input, glm::vec2{1.0F});
    EXPECT_EQ(state.buttons, Controls::Jump);
    EXPECT_FALSE(state.toggleFirstPerson);
}
