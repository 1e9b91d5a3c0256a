#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "engine/ui/FontAtlas.hpp"

namespace engine::platform
{
class Input;
}

namespace engine::core
{
class ErrorChannel;
}

namespace engine::ui
{
struct UiRect
{
    float x = 0.0F;
    float y = 0.0F;
    float w = 0.0F;
    float h = 0.0F;

    [[nodiscard]] bool Contains(float px, float py) const
    {
        return px >= x && py >= y && px <= x + w && py <= y + h;
    }
};

struct UiPadding
{
    float left = 0.0F;
    float top = 0.0F;
    float right = 0.0F;
    float bottom = 0.0F;
};

struct UiTheme
{
    std::string fontPath = "Data/Fonts/BlueHighway.ttf";
    float baseFontSize = 18.0F;
    float spacing = 8.0F;

    glm::vec4 colorPanel{0.10F, 0.12F, 0.16F, 0.94F};
    glm::vec4 colorPanelBorder{0.30F, 0.36F, 0.45F, 1.0F};
    glm::vec4 colorText{0.94F, 0.95F, 0.97F, 1.0F};
    glm::vec4 colorTextMuted{0.62F, 0.66F, 0.72F, 1.0F};
    glm::vec4 colorAccent{0.26F, 0.59F, 0.98F, 1.0F};
    glm::vec4 colorButton{0.20F, 0.25F, 0.32F, 1.0F};
    glm::vec4 colorButtonHover{0.26F, 0.33F, 0.42F, 1.0F};
    glm::vec4 colorButtonPressed{0.16F, 0.44F, 0.78F, 1.0F};
};

/// A missing file leaves |outTheme| at defaults and succeeds. Malformed JSON
/// fails and leaves it untouched.
[[nodiscard]] bool LoadUiTheme(const std::string& path, UiTheme* outTheme, std::string* outError = nullptr);

/// Immediate-mode widgets for the pages, the console fallback and overlays.
/// Layout and interaction work without a GL context; only Initialize() and
/// EndFrame() touch GL.
class UiSystem
{
public:
    struct BeginFrameArgs
    {
        const platform::Input* input = nullptr;
        int framebufferWidth = 0;
        int framebufferHeight = 0;
        int windowWidth = 0;
        int windowHeight = 0;
        float deltaSeconds = 0.0F;
        bool interactive = true;
    };

    static constexpr const char* kDefaultThemePath = "config/ui_theme.json";
    /// Row heights in unscaled pixels.
    static constexpr float kButtonHeight = 36.0F;
    static constexpr float kSliderHeight = 28.0F;

    /// Font problems are reported to |errors| and leave text undrawn.
    bool Initialize(core::ErrorChannel* errors, const std::string& themePath = kDefaultThemePath);
    void Shutdown();

    void BeginFrame(const BeginFrameArgs& args);
    void EndFrame();

    /// Marks touches that land on widgets built last frame as over UI, so
    /// camera gestures skip them.
    void ClaimTouches(platform::Input& input) const;
    /// A slider drag or held button keeps focus until release.
    [[nodiscard]] bool HasActiveWidget() const { return !m_activeId.empty(); }
    [[nodiscard]] glm::vec2 WindowToUi(const glm::vec2& windowPoint) const { return windowPoint * m_windowToUi; }

    [[nodiscard]] int ScreenWidth() const { return m_screenWidth; }
    [[nodiscard]] int ScreenHeight() const { return m_screenHeight; }
    [[nodiscard]] const UiTheme& Theme() const { return m_theme; }
    void SetTheme(const UiTheme& theme) { m_theme = theme; }

    void BeginPanel(const UiRect& rect, const UiPadding& padding, bool drawBackground = true);
    void EndPanel();
    [[nodiscard]] UiRect AllocateRect(float height, float width = -1.0F);
    /// Rest of the current panel, minus |reserveBelow| pixels kept for later rows.
    [[nodiscard]] UiRect AllocateRemaining(float reserveBelow);
    [[nodiscard]] UiRect CurrentContentRect() const;

    void Label(const std::string& text, const glm::vec4& color, float fontScale = 1.0F);
    void Label(const std::string& text, float fontScale = 1.0F);
    bool Button(const std::string& id, const std::string& label, float width = -1.0F);
    bool ButtonAt(const std::string& id, const std::string& label, const UiRect& rect, bool* outHeld = nullptr);
    /// Returns true while a drag changes |value|.
    bool SliderFloat(const std::string& id, float* value, float minValue, float maxValue, const char* format = "%.2f");

    void DrawRect(const UiRect& rect, const glm::vec4& color);
    void DrawRectOutline(const UiRect& rect, float thickness, const glm::vec4& color);
    void DrawTextLabel(float x, float y, std::string_view text, const glm::vec4& color, float fontScale = 1.0F);
    [[nodiscard]] float TextWidth(std::string_view text, float fontScale = 1.0F) const;
    [[nodiscard]] float LineHeight(float fontScale = 1.0F) const;

    [[nodiscard]] float Scale() const { return m_scale; }
    [[nodiscard]] std::size_t VertexCount() const { return m_vertices.size(); }

private:
    struct Vertex
    {
        glm::vec2 position{0.0F};
        glm::vec2 uv{0.0F};
        glm::vec4 color{1.0F};
        // 1 samples the glyph atlas, 0 draws flat color.
        float glyph = 0.0F;
    };

    struct Panel
    {
        UiRect content{};
        float used = 0.0F;
        float gap = 0.0F;
    };

    struct Pointer
    {
        glm::vec2 position{0.0F};
        bool pressed = false;
        bool down = false;
        bool released = false;
    };

    struct Interaction
    {
        bool hovered = false;
        bool held = false;
        bool clicked = false;
    };

    bool CreateGpuResources();
    void DestroyGpuResources();
    void LoadFont();
    void UploadFontTexture();

    [[nodiscard]] Interaction Interact(const std::string& id, const UiRect& rect);
    [[nodiscard]] float FontPixels(float fontScale) const;
    void PushQuad(const UiRect& rect, const glm::vec4& color, const glm::vec4& uv, float glyph);

    core::ErrorChannel* m_errors = nullptr;
    UiTheme m_theme{};
    FontAtlas m_font;

    Pointer m_pointer{};
    glm::vec2 m_windowToUi{1.0F, 1.0F};
    int m_screenWidth = 1;
    int m_screenHeight = 1;
    float m_scale = 1.0F;
    bool m_interactive = true;

    std::vector<Panel> m_panels;
    std::vector<UiRect> m_widgetRects;
    std::vector<UiRect> m_lastWidgetRects;
    std::string m_activeId;
    std::vector<Vertex> m_vertices;

    unsigned int m_program = 0;
    unsigned int m_vao = 0;
    unsigned int m_vbo = 0;
    unsigned int m_glyphTexture = 0;
    int m_viewportSizeLocation = -1;
    int m_glyphAtlasLocation = -1;
};
} // namespace engine::ui
