#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <GLFW/glfw3.h>

#include "engine/platform/Input.hpp"
#include "engine/ui/FontAtlas.hpp"
#include "engine/ui/UiSystem.hpp"
#include "tests/TestHelpers.hpp"

using engine::platform::Input;
using engine::platform::TouchState;
using engine::ui::UiPadding;
using engine::ui::UiRect;
using engine::ui::UiSystem;
using engine::ui::UiTheme;

namespace
{
class UiSystemTest : public ::testing::Test
{
protected:
    // 1080 rows keeps the UI scale at exactly one.
    void Frame(int windowWidth = 1920, int windowHeight = 1080)
    {
        m_ui.BeginFrame(UiSystem::BeginFrameArgs{&m_input, 1920, 1080, windowWidth, windowHeight, 1.0F / 60.0F, true});
    }

    void Mouse(const glm::vec2& position, bool down)
    {
        m_input.BeginSnapshot();
        m_input.SetMousePosition(position);
        m_input.SetMouseButton(GLFW_MOUSE_BUTTON_LEFT, down);
    }

    Input m_input;
    UiSystem m_ui;
};

void WriteFile(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream stream(path);
    stream << text;
}
} // namespace

TEST_F(UiSystemTest, PanelRowsStackWithThemeSpacing)
{
    Frame();
    EXPECT_FLOAT_EQ(m_ui.Scale(), 1.0F);

    m_ui.BeginPanel(UiRect{100.0F, 50.0F, 400.0F, 300.0F}, UiPadding{10.0F, 20.0F, 10.0F, 20.0F}, false);
    const UiRect first = m_ui.AllocateRect(36.0F);
    EXPECT_FLOAT_EQ(first.x, 110.0F);
    EXPECT_FLOAT_EQ(first.y, 70.0F);
    EXPECT_FLOAT_EQ(first.w, 380.0F);
    EXPECT_FLOAT_EQ(first.h, 36.0F);

    const UiRect rest = m_ui.AllocateRemaining(0.0F);
    EXPECT_FLOAT_EQ(rest.y, 114.0F);
    EXPECT_FLOAT_EQ(rest.h, 208.0F);
    m_ui.EndPanel();

    EXPECT_FLOAT_EQ(m_ui.CurrentContentRect().w, 0.0F);
}

TEST_F(UiSystemTest, SmallFramebufferClampsScale)
{
    m_ui.BeginFrame(UiSystem::BeginFrameArgs{&m_input, 960, 540, 960, 540, 0.0F, true});
    EXPECT_FLOAT_EQ(m_ui.Scale(), 0.65F);
}

TEST_F(UiSystemTest, ButtonClicksOnReleaseInside)
{
    const UiRect rect{100.0F, 100.0F, 200.0F, 100.0F};

    Mouse(glm::vec2{150.0F, 150.0F}, true);
    Frame();
    bool held = false;
    EXPECT_FALSE(m_ui.ButtonAt("ok", "OK", rect, &held));
    EXPECT_TRUE(held);
    EXPECT_TRUE(m_ui.HasActiveWidget());
    EXPECT_GT(m_ui.VertexCount(), 0U);

    Mouse(glm::vec2{150.0F, 150.0F}, false);
    Frame();
    EXPECT_TRUE(m_ui.ButtonAt("ok", "OK", rect));

    charsurf::test::NextFrame(m_input);
    Frame();
    EXPECT_FALSE(m_ui.HasActiveWidget());
}

TEST_F(UiSystemTest, ButtonIgnoresReleaseOutside)
{
    const UiRect rect{100.0F, 100.0F, 200.0F, 100.0F};

    Mouse(glm::vec2{150.0F, 150.0F}, true);
    Frame();
    (void)m_ui.ButtonAt("ok", "OK", rect);

    Mouse(glm::vec2{600.0F, 600.0F}, false);
    Frame();
    EXPECT_FALSE(m_ui.ButtonAt("ok", "OK", rect));
}

TEST_F(UiSystemTest, NonInteractiveFrameIgnoresPointer)
{
    Mouse(glm::vec2{150.0F, 150.0F}, true);
    m_ui.BeginFrame(UiSystem::BeginFrameArgs{&m_input, 1920, 1080, 1920, 1080, 0.0F, false});
    (void)m_ui.ButtonAt("ok", "OK", UiRect{100.0F, 100.0F, 200.0F, 100.0F});
    EXPECT_FALSE(m_ui.HasActiveWidget());
}

TEST_F(UiSystemTest, SliderFollowsDrag)
{
    float value = 0.0F;

    Mouse(glm::vec2{150.0F, 10.0F}, true);
    Frame();
    m_ui.BeginPanel(UiRect{0.0F, 0.0F, 200.0F, 100.0F}, UiPadding{}, false);
    EXPECT_TRUE(m_ui.SliderFloat("volume", &value, 0.0F, 1.0F));
    m_ui.EndPanel();
    EXPECT_NEAR(value, 0.75F, 1e-4F);

    // Dragging past the end clamps.
    Mouse(glm::vec2{900.0F, 300.0F}, true);
    Frame();
    m_ui.BeginPanel(UiRect{0.0F, 0.0F, 200.0F, 100.0F}, UiPadding{}, false);
    EXPECT_TRUE(m_ui.SliderFloat("volume", &value, 0.0F, 1.0F));
    m_ui.EndPanel();
    EXPECT_FLOAT_EQ(value, 1.0F);
}

TEST_F(UiSystemTest, ClaimTouchesUsesLastFrameWidgets)
{
    Frame(960, 540);
    (void)m_ui.ButtonAt("ok", "OK", UiRect{100.0F, 100.0F, 200.0F, 200.0F});

    m_input.BeginSnapshot();
    TouchState inside;
    inside.id = 1;
    inside.position = glm::vec2{60.0F, 60.0F};
    TouchState outside;
    outside.id = 2;
    outside.position = glm::vec2{300.0F, 300.0F};
    m_input.SetTouches(std::vector<TouchState>{inside, outside});

    Frame(960, 540);
    m_ui.ClaimTouches(m_input);
    EXPECT_TRUE(m_input.Touch(0).overUiElement);
    EXPECT_FALSE(m_input.Touch(1).overUiElement);
}

TEST_F(UiSystemTest, TextWithoutFontStillMeasures)
{
    Frame();
    EXPECT_FLOAT_EQ(m_ui.TextWidth("abcd"), 4.0F * 18.0F * 0.5F);
    EXPECT_GT(m_ui.LineHeight(), 0.0F);

    const std::size_t before = m_ui.VertexCount();
    m_ui.DrawTextLabel(0.0F, 0.0F, "hidden", m_ui.Theme().colorText);
    EXPECT_EQ(m_ui.VertexCount(), before);
}

TEST(UiThemeTest, MissingFileKeepsDefaults)
{
    UiTheme theme;
    theme.spacing = 99.0F;
    EXPECT_TRUE(engine::ui::LoadUiTheme("/nonexistent/ui_theme.json", &theme));
    EXPECT_FLOAT_EQ(theme.spacing, UiTheme{}.spacing);
}

TEST(UiThemeTest, ReadsPartialTheme)
{
    const charsurf::test::TempPathGuard file(charsurf::test::MakeTempPath("theme"));
    WriteFile(file.Path(), R"({"spacing": 4.0, "colors": {"text": [1.0, 0.0, 0.0, 1.0]}})");

    UiTheme theme;
    std::string error;
    ASSERT_TRUE(engine::ui::LoadUiTheme(file.Path().string(), &theme, &error)) << error;
    EXPECT_FLOAT_EQ(theme.spacing, 4.0F);
    EXPECT_FLOAT_EQ(theme.colorText.g, 0.0F);
    EXPECT_FLOAT_EQ(theme.baseFontSize, UiTheme{}.baseFontSize);
}

TEST(UiThemeTest, MalformedThemeFailsUntouched)
{
    const charsurf::test::TempPathGuard file(charsurf::test::MakeTempPath("theme"));
    WriteFile(file.Path(), "{ not json");

    UiTheme theme;
    theme.spacing = 3.0F;
    std::string error;
    EXPECT_FALSE(engine::ui::LoadUiTheme(file.Path().string(), &theme, &error));
    EXPECT_FLOAT_EQ(theme.spacing, 3.0F);
    EXPECT_NE(error.find("Invalid UI theme"), std::string::npos);
}

TEST(FontAtlasTest, RejectsMissingAndEmptyFonts)
{
    engine::ui::FontAtlas atlas;
    std::string error;
    EXPECT_FALSE(atlas.LoadFromFile("/nonexistent/font.ttf", &error));
    EXPECT_NE(error.find("Failed to open font"), std::string::npos);

    EXPECT_FALSE(atlas.Bake({}, &error));
    EXPECT_EQ(error, "Font file is empty");
    EXPECT_FALSE(atlas.IsLoaded());
    EXPECT_TRUE(atlas.Layout("text", glm::vec2{0.0F}, 18.0F).empty());
}
