#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <GLFW/glfw3.h>

#include "demo/app/CharacterDemo.hpp"
#include "engine/core/ErrorChannel.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "engine/platform/Input.hpp"
#include "tests/TestHelpers.hpp"
#include "ui/DeveloperConsole.hpp"

using demo::app::CharacterDemo;
using demo::app::CharacterDemoOptions;

namespace
{
class CharacterDemoTest : public ::testing::Test
{
protected:
    CharacterDemoTest()
        : m_programDir(charsurf::test::MakeTempPath("demo"))
    {
    }

    std::unique_ptr<CharacterDemo> MakeDemo(int mushrooms = 4, int boxes = 4)
    {
        CharacterDemoOptions options;
        options.config.randomSeed = 5U;
        options.config.mushroomCount = mushrooms;
        options.config.boxCount = boxes;
        options.config.platform = "Linux";
        options.errors = &m_errors;
        return std::make_unique<CharacterDemo>(m_bindings, options);
    }

    demo::pages::SurfaceOptions Options() const
    {
        demo::pages::SurfaceOptions options;
        options.resourcePath = "Data";
        options.programDir = m_programDir.Path();
        return options;
    }

    demo::pages::SurfaceFrame Frame()
    {
        demo::pages::SurfaceFrame frame;
        frame.input = &m_input;
        frame.bindings = &m_bindings;
        frame.viewport = engine::ui::UiRect{0.0F, 0.0F, 1280.0F, 720.0F};
        frame.deltaSeconds = 1.0F / 60.0F;
        return frame;
    }

    void RunFrames(CharacterDemo& demo, int frames)
    {
        for (int i = 0; i < frames; ++i)
        {
            charsurf::test::NextFrame(m_input);
            demo.Update(Frame());
        }
    }

    void Tap(CharacterDemo& demo, int key)
    {
        charsurf::test::PressKey(m_input, key);
        demo.Update(Frame());
        charsurf::test::NextFrame(m_input);
        m_input.SetKey(key, false);
        demo.Update(Frame());
    }

    std::vector<std::string> DispatchErrors()
    {
        std::vector<std::string> messages;
        const std::size_t token = m_errors.Subscribe([&messages](const engine::core::ErrorReport& report) {
            messages.push_back(report.message);
        });
        (void)m_errors.Dispatch();
        m_errors.Unsubscribe(token);
        return messages;
    }

    charsurf::test::TempPathGuard m_programDir;
    engine::core::ErrorChannel m_errors;
    engine::platform::ActionBindings m_bindings;
    engine::platform::Input m_input;
};
} // namespace

TEST_F(CharacterDemoTest, StartBuildsSeededScene)
{
    auto demo = MakeDemo();
    std::string error;
    ASSERT_TRUE(demo->Start(Options(), &error)) << error;

    EXPECT_EQ(demo->Seed(), 5U);
    EXPECT_EQ(demo->Handles().mushrooms.size(), 4U);
    EXPECT_EQ(demo->Handles().boxes.size(), 4U);
    ASSERT_NE(demo->GetCharacter(), nullptr);
    EXPECT_TRUE(demo->GetCharacter()->IsAttached());
    EXPECT_FALSE(demo->Aggregator().TouchEnabled());
    EXPECT_FLOAT_EQ(demo->Rig().FarClip(), 300.0F);
    EXPECT_EQ(demo->ScenePath(), m_programDir.Path() / "Data" / "Scenes/CharacterDemo.json");
}

TEST_F(CharacterDemoTest, NegativeCountsFailToStart)
{
    auto demo = MakeDemo(-1, 4);
    std::string error;
    EXPECT_FALSE(demo->Start(Options(), &error));
    EXPECT_EQ(error, "Scene object counts must not be negative.");
    EXPECT_EQ(demo->GetCharacter(), nullptr);
}

TEST_F(CharacterDemoTest, CharacterLandsAndWalks)
{
    auto demo = MakeDemo(0, 0);
    ASSERT_TRUE(demo->Start(Options(), nullptr));

    RunFrames(*demo, 90);
    EXPECT_TRUE(demo->GetCharacter()->IsSoftGrounded());

    const engine::scene::Entity jack = demo->Handles().character;
    const float startZ = demo->World().Transforms().at(jack).position.z;
    charsurf::test::PressKey(m_input, GLFW_KEY_W);
    for (int i = 0; i < 60; ++i)
    {
        demo->Update(Frame());
        charsurf::test::NextFrame(m_input);
    }
    EXPECT_LT(demo->World().Transforms().at(jack).position.z, startZ - 1.0F);
}

TEST_F(CharacterDemoTest, SaveThenLoadRestoresJack)
{
    auto demo = MakeDemo();
    ASSERT_TRUE(demo->Start(Options(), nullptr));
    RunFrames(*demo, 60);

    charsurf::test::NextFrame(m_input);
    m_input.SetMouseDelta(glm::vec2{300.0F, 50.0F});
    demo->Update(Frame());
    const float savedYaw = demo->GetCharacter()->GetControls().yaw;
    ASSERT_FLOAT_EQ(savedYaw, 30.0F);

    Tap(*demo, GLFW_KEY_F5);
    ASSERT_TRUE(std::filesystem::exists(demo->ScenePath()));
    const engine::scene::Entity jack = demo->Handles().character;
    const glm::vec3 savedPosition = demo->World().Transforms().at(jack).position;

    demo->World().Transforms().at(jack).position = glm::vec3{20.0F, 5.0F, 20.0F};
    charsurf::test::NextFrame(m_input);
    m_input.SetMouseDelta(glm::vec2{300.0F, 50.0F});
    demo->Update(Frame());
    const float pitchBeforeLoad = demo->GetCharacter()->GetControls().pitch;

    std::string error;
    ASSERT_TRUE(demo->LoadScene(&error)) << error;
    ASSERT_NE(demo->GetCharacter(), nullptr);
    EXPECT_EQ(demo->GetCharacter()->GetEntity(), jack);
    EXPECT_NEAR(demo->GetCharacter()->GetControls().yaw, savedYaw, 1.0e-3F);
    EXPECT_FLOAT_EQ(demo->GetCharacter()->GetControls().pitch, pitchBeforeLoad);
    EXPECT_NEAR(demo->World().Transforms().at(jack).position.x, savedPosition.x, 0.05F);
    EXPECT_NEAR(demo->World().Transforms().at(jack).position.y, savedPosition.y, 0.05F);
    EXPECT_EQ(demo->Handles().boxes.size(), 4U);
    EXPECT_TRUE(DispatchErrors().empty());
}

TEST_F(CharacterDemoTest, LoadWithoutSaveReportsError)
{
    auto demo = MakeDemo();
    ASSERT_TRUE(demo->Start(Options(), nullptr));

    Tap(*demo, GLFW_KEY_F7);

    const std::vector<std::string> messages = DispatchErrors();
    ASSERT_EQ(messages.size(), 1U);
    EXPECT_EQ(messages.front().rfind("Failed to load scene: Unable to open file", 0), 0U);
    EXPECT_NE(demo->GetCharacter(), nullptr);
}

TEST_F(CharacterDemoTest, LoadWithoutJackKeepsRunningScene)
{
    auto demo = MakeDemo(0, 0);
    ASSERT_TRUE(demo->Start(Options(), nullptr));
    RunFrames(*demo, 90);

    const engine::scene::Entity jack = demo->Handles().character;
    demo->World().Names().at(jack).name = "Jill";
    Tap(*demo, GLFW_KEY_F5);
    demo->World().Names().at(jack).name = "Jack";
    ASSERT_TRUE(DispatchErrors().empty());

    Tap(*demo, GLFW_KEY_F7);
    const std::vector<std::string> messages = DispatchErrors();
    ASSERT_EQ(messages.size(), 1U);
    EXPECT_EQ(messages.front(), "Failed to load scene: Loaded scene has no node named Jack");

    ASSERT_NE(demo->GetCharacter(), nullptr);
    EXPECT_EQ(demo->GetCharacter()->GetEntity(), jack);
    EXPECT_TRUE(demo->GetCharacter()->IsAttached());
    EXPECT_EQ(demo->World().FindByName("Jack"), std::optional<engine::scene::Entity>{jack});

    const float startZ = demo->World().Transforms().at(jack).position.z;
    charsurf::test::PressKey(m_input, GLFW_KEY_W);
    for (int i = 0; i < 60; ++i)
    {
        demo->Update(Frame());
        charsurf::test::NextFrame(m_input);
    }
    EXPECT_LT(demo->World().Transforms().at(jack).position.z, startZ - 1.0F);
}

TEST_F(CharacterDemoTest, EscapeRequestsExit)
{
    auto demo = MakeDemo(0, 0);
    ASSERT_TRUE(demo->Start(Options(), nullptr));
    EXPECT_FALSE(demo->ExitRequested());

    Tap(*demo, GLFW_KEY_ESCAPE);
    EXPECT_TRUE(demo->ExitRequested());
}

TEST_F(CharacterDemoTest, EscapeClosesConsoleFirst)
{
    auto demo = MakeDemo(0, 0);
    ASSERT_TRUE(demo->Start(Options(), nullptr));
    ui::DeveloperConsole console;

    demo::pages::SurfaceFrame frame = Frame();
    frame.console = &console;
    charsurf::test::PressKey(m_input, GLFW_KEY_F1);
    demo->Update(frame);
    EXPECT_TRUE(console.IsOpen());

    charsurf::test::NextFrame(m_input);
    m_input.SetKey(GLFW_KEY_F1, false);
    charsurf::test::PressKey(m_input, GLFW_KEY_ESCAPE);
    demo->Update(frame);
    EXPECT_FALSE(console.IsOpen());
    EXPECT_FALSE(demo->ExitRequested());
}

TEST_F(CharacterDemoTest, ScreenshotKeyQueuesCapture)
{
    auto demo = MakeDemo(0, 0);
    ASSERT_TRUE(demo->Start(Options(), nullptr));

    Tap(*demo, GLFW_KEY_9);
    const std::string expectedPrefix = (m_programDir.Path() / "Data").string() + "/Screenshot_CharacterDemo_";
    EXPECT_EQ(demo->PendingScreenshot().rfind(expectedPrefix, 0), 0U) << demo->PendingScreenshot();
}

TEST_F(CharacterDemoTest, QualityKeysUpdateSettings)
{
    auto demo = MakeDemo(0, 0);
    ASSERT_TRUE(demo->Start(Options(), nullptr));

    Tap(*demo, GLFW_KEY_4);
    EXPECT_FALSE(demo->Quality().drawShadows);
    Tap(*demo, GLFW_KEY_5);
    EXPECT_EQ(demo->Quality().shadowMapSize, 2048);
}

TEST_F(CharacterDemoTest, ConsoleContextDrivesSample)
{
    auto demo = MakeDemo(0, 0);
    ASSERT_TRUE(demo->Start(Options(), nullptr));

    ui::ConsoleContext context;
    demo->FillConsoleContext(context);
    ui::ConsoleCommands commands;

    commands.Execute("camera_distance 50", context);
    EXPECT_FLOAT_EQ(demo->Rig().Distance(), 20.0F);

    commands.Execute("first_person on", context);
    EXPECT_TRUE(demo->Rig().IsFirstPerson());

    commands.Execute("gyro on", context);
    EXPECT_FALSE(demo->Aggregator().Touch().UseGyroscope());

    commands.Execute("save", context);
    EXPECT_TRUE(std::filesystem::exists(demo->ScenePath()));

    commands.Execute("screenshot", context);
    EXPECT_FALSE(demo->PendingScreenshot().empty());
}

TEST_F(CharacterDemoTest, TouchEmulationEnablesTouch)
{
    CharacterDemoOptions options;
    options.config.randomSeed = 5U;
    options.config.mushroomCount = 0;
    options.config.boxCount = 0;
    options.config.platform = "Linux";
    options.config.touchEmulation = true;
    CharacterDemo demo(m_bindings, options);
    ASSERT_TRUE(demo.Start(Options(), nullptr));

    EXPECT_TRUE(demo.Aggregator().TouchEnabled());
    RunFrames(demo, 2);
}

TEST_F(CharacterDemoTest, StopReleasesScene)
{
    auto demo = MakeDemo();
    ASSERT_TRUE(demo->Start(Options(), nullptr));
    demo->Stop();

    EXPECT_EQ(demo->GetCharacter(), nullptr);
    EXPECT_TRUE(demo->World().Entities().empty());

    std::string error;
    EXPECT_FALSE(demo->SaveScene(&error));
    EXPECT_EQ(error, "Sample is not running.");
}
