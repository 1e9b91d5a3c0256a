#include <gtest/gtest.h>

#include <string>

#include "ui/DeveloperConsole.hpp"

using ui::ConsoleCommands;
using ui::ConsoleContext;

namespace
{
bool LogContains(const ConsoleCommands& commands, const std::string& text)
{
    for (const std::string& item : commands.Items())
    {
        if (item == text)
        {
            return true;
        }
    }
    return false;
}
} // namespace

TEST(DeveloperConsoleTest, UnknownCommandIsReported)
{
    ConsoleCommands commands;
    commands.Execute("fly", ConsoleContext{});
    EXPECT_TRUE(LogContains(commands, "# fly"));
    EXPECT_TRUE(LogContains(commands, "Unknown command. Type `help`."));
}

TEST(DeveloperConsoleTest, MissingHooksAreUnavailable)
{
    ConsoleCommands commands;
    const ConsoleContext context;
    commands.Execute("save", context);
    commands.Execute("quality", context);
    EXPECT_TRUE(LogContains(commands, "save is unavailable."));
    EXPECT_TRUE(LogContains(commands, "quality is unavailable."));
}

TEST(DeveloperConsoleTest, SaveAndLoadReportResult)
{
    ConsoleCommands commands;
    ConsoleContext context;
    context.saveScene = [](std::string*) { return true; };
    context.loadScene = [](std::string* error) {
        *error = "Unable to open file: Data/Scenes/CharacterDemo.json";
        return false;
    };

    commands.Execute("save", context);
    commands.Execute("load", context);
    EXPECT_TRUE(LogContains(commands, "Scene saved."));
    EXPECT_TRUE(LogContains(commands, "Failed to load scene: Unable to open file: Data/Scenes/CharacterDemo.json"));
}

TEST(DeveloperConsoleTest, FirstPersonTogglesWithoutArgument)
{
    ConsoleCommands commands;
    bool firstPerson = false;
    ConsoleContext context;
    context.firstPerson = [&firstPerson]() { return firstPerson; };
    context.setFirstPerson = [&firstPerson](bool enabled) { firstPerson = enabled; };

    commands.Execute("first_person", context);
    EXPECT_TRUE(firstPerson);
    commands.Execute("first_person off", context);
    EXPECT_FALSE(firstPerson);
    commands.Execute("first_person maybe", context);
    EXPECT_TRUE(LogContains(commands, "Usage: first_person on|off"));
}

TEST(DeveloperConsoleTest, GyroFailsWithoutTouch)
{
    ConsoleCommands commands;
    ConsoleContext context;
    context.setGyroscope = [](bool) { return false; };

    commands.Execute("gyro on", context);
    EXPECT_TRUE(LogContains(commands, "Failed to change gyroscope: touch input is disabled."));
}

TEST(DeveloperConsoleTest, CameraDistanceParsesFloat)
{
    ConsoleCommands commands;
    float distance = 5.0F;
    ConsoleContext context;
    context.setCameraDistance = [&distance](float value) { distance = value; };
    context.cameraDistance = [&distance]() { return distance; };

    commands.Execute("camera_distance 7.5", context);
    EXPECT_FLOAT_EQ(distance, 7.5F);
    EXPECT_TRUE(LogContains(commands, "Camera distance 7.5."));

    commands.Execute("camera_distance far", context);
    EXPECT_FLOAT_EQ(distance, 7.5F);
    EXPECT_TRUE(LogContains(commands, "Usage: camera_distance <v>"));
}

TEST(DeveloperConsoleTest, SeedRejectsNegative)
{
    ConsoleCommands commands;
    std::uint32_t seed = 0;
    ConsoleContext context;
    context.setSeed = [&seed](std::uint32_t value) { seed = value; };

    commands.Execute("seed -3", context);
    EXPECT_EQ(seed, 0U);
    commands.Execute("seed 99", context);
    EXPECT_EQ(seed, 99U);
    EXPECT_TRUE(LogContains(commands, "Seed set to 99."));
}

TEST(DeveloperConsoleTest, ScreenshotLogsPath)
{
    ConsoleCommands commands;
    ConsoleContext context;
    context.takeScreenshot = [](std::string* path, std::string*) {
        *path = "Data/Screenshot_CharacterDemo_2026-01-01-00-00-00.png";
        return true;
    };

    commands.Execute("screenshot", context);
    EXPECT_TRUE(LogContains(commands, "Screenshot: Data/Screenshot_CharacterDemo_2026-01-01-00-00-00.png"));
}

TEST(DeveloperConsoleTest, CompletionAndHints)
{
    ConsoleCommands commands;
    EXPECT_EQ(commands.Complete("scr"), "screenshot ");
    EXPECT_EQ(commands.Complete("s"), "s");
    EXPECT_TRUE(LogContains(commands, "Possible matches:"));

    const auto hints = commands.BuildHints("ca");
    ASSERT_EQ(hints.size(), 1U);
    EXPECT_EQ(hints.front().usage, "camera_distance <v>");
}

TEST(DeveloperConsoleTest, HistoryStepsBackAndForward)
{
    ConsoleCommands commands;
    const ConsoleContext context;
    commands.Execute("help", context);
    commands.Execute("quality", context);
    commands.Execute("help", context);

    ASSERT_EQ(commands.History().size(), 2U);
    EXPECT_EQ(commands.HistoryStep(-1), "help");
    EXPECT_EQ(commands.HistoryStep(-1), "quality");
    EXPECT_EQ(commands.HistoryStep(-1), "quality");
    EXPECT_EQ(commands.HistoryStep(1), "help");
    EXPECT_EQ(commands.HistoryStep(1), "");
}

TEST(DeveloperConsoleTest, ToggleWithoutWindow)
{
    ui::DeveloperConsole console;
    EXPECT_FALSE(console.IsOpen());
    console.Toggle();
    EXPECT_TRUE(console.IsOpen());
    console.Toggle();
    EXPECT_FALSE(console.IsOpen());
}
