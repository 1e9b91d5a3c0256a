#include <gtest/gtest.h>

#include <regex>

#include <GLFW/glfw3.h>

#include "demo/app/SampleHost.hpp"
#include "engine/platform/ActionBindings.hpp"
#include "tests/TestHelpers.hpp"

using demo::app::HostActions;
using demo::app::SampleHost;

namespace
{
class SampleHostTest : public ::testing::Test
{
protected:
    HostActions Press(int key, bool consoleOpen = false, bool uiHasFocus = false)
    {
        charsurf::test::PressKey(m_input, key);
        const HostActions actions = m_host.HandleKeys(m_input, m_bindings, m_quality, consoleOpen, uiHasFocus);
        charsurf::test::NextFrame(m_input);
        m_input.SetKey(key, false);
        return actions;
    }

    SampleHost m_host{"CharacterDemo"};
    engine::platform::ActionBindings m_bindings;
    engine::platform::Input m_input;
    engine::render::RenderQuality m_quality;
};
} // namespace

TEST_F(SampleHostTest, EscapeExitsOrClosesConsole)
{
    EXPECT_TRUE(Press(GLFW_KEY_ESCAPE).exitRequested);

    const HostActions closing = Press(GLFW_KEY_ESCAPE, true);
    EXPECT_FALSE(closing.exitRequested);
    EXPECT_TRUE(closing.toggleConsole);
}

TEST_F(SampleHostTest, FunctionKeysToggleConsoleAndHud)
{
    EXPECT_TRUE(Press(GLFW_KEY_F1).toggleConsole);

    EXPECT_FALSE(m_host.DebugHudVisible());
    (void)Press(GLFW_KEY_F2);
    EXPECT_TRUE(m_host.DebugHudVisible());
    (void)Press(GLFW_KEY_F2, false, true);
    EXPECT_FALSE(m_host.DebugHudVisible());
}

TEST_F(SampleHostTest, NumberKeysChangeQuality)
{
    EXPECT_TRUE(Press(GLFW_KEY_1).qualityChanged);
    EXPECT_EQ(m_quality.textureQuality, 0);

    (void)Press(GLFW_KEY_2);
    EXPECT_EQ(m_quality.materialQuality, 0);

    (void)Press(GLFW_KEY_3);
    EXPECT_FALSE(m_quality.specularLighting);

    (void)Press(GLFW_KEY_4);
    EXPECT_FALSE(m_quality.drawShadows);

    (void)Press(GLFW_KEY_5);
    EXPECT_EQ(m_quality.shadowMapSize, 2048);

    (void)Press(GLFW_KEY_KP_6);
    EXPECT_EQ(m_quality.shadowQuality, 3);

    (void)Press(GLFW_KEY_7);
    EXPECT_EQ(m_quality.maxOccluderTriangles, 0);

    (void)Press(GLFW_KEY_8);
    EXPECT_FALSE(m_quality.dynamicInstancing);

    const HostActions screenshot = Press(GLFW_KEY_9);
    EXPECT_TRUE(screenshot.screenshotRequested);
    EXPECT_FALSE(screenshot.qualityChanged);
}

TEST_F(SampleHostTest, UiFocusBlocksQualityKeys)
{
    const HostActions actions = Press(GLFW_KEY_1, false, true);
    EXPECT_FALSE(actions.qualityChanged);
    EXPECT_EQ(m_quality.textureQuality, 2);
    EXPECT_FALSE(Press(GLFW_KEY_9, false, true).screenshotRequested);
}

TEST_F(SampleHostTest, ScreenshotPathHasTimestamp)
{
    const std::string path = m_host.ScreenshotPath("Data", std::chrono::system_clock::now());
    const std::regex pattern(R"(Data/Screenshot_CharacterDemo_\d{4}-\d{2}-\d{2}-\d{2}-\d{2}-\d{2}\.png)");
    EXPECT_TRUE(std::regex_match(path, pattern)) << path;

    EXPECT_EQ(m_host.ScreenshotPath("Assets/Data/", std::chrono::system_clock::now()).rfind("Assets/Data/Screenshot_", 0), 0U);
    EXPECT_EQ(m_host.ScreenshotPath("", std::chrono::system_clock::now()).rfind("Data/Screenshot_", 0), 0U);
}
