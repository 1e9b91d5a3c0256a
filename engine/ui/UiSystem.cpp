#include "engine/ui/UiSystem.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <iostream>

#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <nlohmann/json.hpp>

#include "engine/core/ErrorChannel.hpp"
#include "engine/platform/Input.hpp"
#include "engine/render/Renderer.hpp"

namespace engine::ui
{
namespace
{
constexpr const char* kOverlayVertexShader = R"(
#version 330 core
layout(location = 0) in vec2 inPosition;
layout(location = 1) in vec2 inUv;
layout(location = 2) in vec4 inColor;
layout(location = 3) in float inGlyph;
uniform vec2 uViewportSize;
out vec2 fragUv;
out vec4 fragColor;
flat out float fragGlyph;
void main()
{
    vec2 clip = inPosition / uViewportSize * 2.0 - 1.0;
    gl_Position = vec4(clip.x, -clip.y, 0.0, 1.0);
    fragUv = inUv;
    fragColor = inColor;
    fragGlyph = inGlyph;
}
)";

constexpr const char* kOverlayFragmentShader = R"(
#version 330 core
in vec2 fragUv;
in vec4 fragColor;
flat in float fragGlyph;
uniform sampler2D uGlyphAtlas;
out vec4 outColor;
void main()
{
    float coverage = mix(1.0, texture(uGlyphAtlas, fragUv).r, step(0.5, fragGlyph));
    outColor = vec4(fragColor.rgb, fragColor.a * coverage);
}
)";

constexpr std::size_t kInitialVertexBytes = 1024 * 1024;

void ReadColor(const nlohmann::json& colors, const char* key, glm::vec4& inOut)
{
    const auto it = colors.find(key);
    if (it == colors.end() || !it->is_array() || it->size() != 4)
    {
        return;
    }
    for (int i = 0; i < 4; ++i)
    {
        inOut[i] = (*it)[static_cast<std::size_t>(i)].get<float>();
    }
}

void AttachFloats(unsigned int location, int count, std::size_t offset, std::size_t stride)
{
    glVertexAttribPointer(location, count, GL_FLOAT, GL_FALSE, static_cast<GLsizei>(stride), reinterpret_cast<void*>(offset));
    glEnableVertexAttribArray(location);
}

std::vector<std::string> FontSearchPaths(const std::string& preferred)
{
    std::vector<std::string> paths{preferred};
#ifdef _WIN32
    paths.emplace_back("C:/Windows/Fonts/segoeui.ttf");
    paths.emplace_back("C:/Windows/Fonts/arial.ttf");
#else
    paths.emplace_back("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
    paths.emplace_back("/usr/share/fonts/dejavu/DejaVuSans.ttf");
    paths.emplace_back("/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf");
#endif
    return paths;
}
} // namespace

bool LoadUiTheme(const std::string& path, UiTheme* outTheme, std::string* outError)
{
    if (outTheme == nullptr)
    {
        return false;
    }
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        *outTheme = UiTheme{};
        return true;
    }

    UiTheme theme;
    try
    {
        const nlohmann::json root = nlohmann::json::parse(stream);
        theme.fontPath = root.value("font_path", theme.fontPath);
        theme.baseFontSize = std::max(6.0F, root.value("base_font_size", theme.baseFontSize));
        theme.spacing = std::max(0.0F, root.value("spacing", theme.spacing));
        const auto colors = root.find("colors");
        if (colors != root.end() && colors->is_object())
        {
            ReadColor(*colors, "panel", theme.colorPanel);
            ReadColor(*colors, "panel_border", theme.colorPanelBorder);
            ReadColor(*colors, "text", theme.colorText);
            ReadColor(*colors, "text_muted", theme.colorTextMuted);
            ReadColor(*colors, "accent", theme.colorAccent);
            ReadColor(*colors, "button", theme.colorButton);
            ReadColor(*colors, "button_hover", theme.colorButtonHover);
            ReadColor(*colors, "button_pressed", theme.colorButtonPressed);
        }
    }
    catch (const std::exception& e)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid UI theme " + path + ": " + e.what();
        }
        return false;
    }
    *outTheme = theme;
    return true;
}

bool UiSystem::Initialize(core::ErrorChannel* errors, const std::string& themePath)
{
    m_errors = errors;
    std::string error;
    if (!LoadUiTheme(themePath, &m_theme, &error))
    {
        std::cerr << "Warning: " << error << ". Using the default theme.\n";
    }
    if (!CreateGpuResources())
    {
        return false;
    }
    LoadFont();
    return true;
}

void UiSystem::Shutdown()
{
    DestroyGpuResources();
}

bool UiSystem::CreateGpuResources()
{
    m_program = render::Renderer::CreateProgram(kOverlayVertexShader, kOverlayFragmentShader);
    if (m_program == 0)
    {
        std::cerr << "Failed to create the UI shader program\n";
        return false;
    }
    m_viewportSizeLocation = glGetUniformLocation(m_program, "uViewportSize");
    m_glyphAtlasLocation = glGetUniformLocation(m_program, "uGlyphAtlas");

    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_vbo);
    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER, kInitialVertexBytes, nullptr, GL_DYNAMIC_DRAW);
    AttachFloats(0, 2, offsetof(Vertex, position), sizeof(Vertex));
    AttachFloats(1, 2, offsetof(Vertex, uv), sizeof(Vertex));
    AttachFloats(2, 4, offsetof(Vertex, color), sizeof(Vertex));
    AttachFloats(3, 1, offsetof(Vertex, glyph), sizeof(Vertex));
    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    return true;
}

void UiSystem::DestroyGpuResources()
{
    glDeleteTextures(1, &m_glyphTexture);
    glDeleteBuffers(1, &m_vbo);
    glDeleteVertexArrays(1, &m_vao);
    glDeleteProgram(m_program);
    m_glyphTexture = 0;
    m_vbo = 0;
    m_vao = 0;
    m_program = 0;
}

void UiSystem::LoadFont()
{
    for (const std::string& path : FontSearchPaths(m_theme.fontPath))
    {
        std::string error;
        if (m_font.LoadFromFile(path, &error))
        {
            UploadFontTexture();
            return;
        }
        if (m_errors != nullptr)
        {
            m_errors->Report("UiSystem", error, core::ErrorSeverity::Warning);
        }
    }
    if (m_errors != nullptr)
    {
        m_errors->Report("UiSystem", "No usable UI font found, text is disabled", core::ErrorSeverity::Warning);
    }
}

void UiSystem::UploadFontTexture()
{
    glGenTextures(1, &m_glyphTexture);
    glBindTexture(GL_TEXTURE_2D, m_glyphTexture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(
        GL_TEXTURE_2D,
        0,
        GL_R8,
        FontAtlas::kAtlasSize,
        FontAtlas::kAtlasSize,
        0,
        GL_RED,
        GL_UNSIGNED_BYTE,
        m_font.Bitmap().data()
    );
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glBindTexture(GL_TEXTURE_2D, 0);
    m_font.ReleaseBitmap();
}

void UiSystem::BeginFrame(const BeginFrameArgs& args)
{
    m_screenWidth = std::max(args.framebufferWidth, 1);
    m_screenHeight = std::max(args.framebufferHeight, 1);
    m_windowToUi = glm::vec2{static_cast<float>(m_screenWidth), static_cast<float>(m_screenHeight)}
        / glm::vec2{static_cast<float>(std::max(args.windowWidth, 1)), static_cast<float>(std::max(args.windowHeight, 1))};
    m_scale = std::max(0.65F, static_cast<float>(m_screenHeight) / 1080.0F);
    m_interactive = args.interactive;

    m_pointer = Pointer{};
    if (args.input != nullptr)
    {
        m_pointer.position = WindowToUi(args.input->MousePosition());
        m_pointer.pressed = args.input->IsMousePressed(GLFW_MOUSE_BUTTON_LEFT);
        m_pointer.down = args.input->IsMouseDown(GLFW_MOUSE_BUTTON_LEFT);
        m_pointer.released = args.input->IsMouseReleased(GLFW_MOUSE_BUTTON_LEFT);
    }
    if (!m_pointer.down && !m_pointer.released)
    {
        m_activeId.clear();
    }

    m_panels.clear();
    m_lastWidgetRects.swap(m_widgetRects);
    m_widgetRects.clear();
    m_vertices.clear();
}

void UiSystem::EndFrame()
{
    if (m_program == 0 || m_vertices.empty())
    {
        return;
    }

    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glUseProgram(m_program);
    glUniform2f(m_viewportSizeLocation, static_cast<float>(m_screenWidth), static_cast<float>(m_screenHeight));
    glUniform1i(m_glyphAtlasLocation, 0);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, m_glyphTexture);

    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    const auto bytes = static_cast<GLsizeiptr>(m_vertices.size() * sizeof(Vertex));
    glBufferData(GL_ARRAY_BUFFER, bytes, m_vertices.data(), GL_DYNAMIC_DRAW);
    glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(m_vertices.size()));

    glBindVertexArray(0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);
    glDisable(GL_BLEND);
    glEnable(GL_DEPTH_TEST);
}

void UiSystem::ClaimTouches(platform::Input& input) const
{
    for (std::size_t i = 0; i < input.NumTouches(); ++i)
    {
        const glm::vec2 point = WindowToUi(input.Touch(i).position);
        const bool overWidget = std::any_of(m_lastWidgetRects.begin(), m_lastWidgetRects.end(), [&point](const UiRect& rect) {
            return rect.Contains(point.x, point.y);
        });
        if (overWidget)
        {
            input.MarkTouchOverUi(i, true);
        }
    }
}

void UiSystem::BeginPanel(const UiRect& rect, const UiPadding& padding, bool drawBackground)
{
    if (drawBackground)
    {
        DrawRect(rect, m_theme.colorPanel);
        DrawRectOutline(rect, 1.0F, m_theme.colorPanelBorder);
    }
    Panel panel;
    panel.content.x = rect.x + padding.left * m_scale;
    panel.content.y = rect.y + padding.top * m_scale;
    panel.content.w = std::max(1.0F, rect.w - (padding.left + padding.right) * m_scale);
    panel.content.h = std::max(1.0F, rect.h - (padding.top + padding.bottom) * m_scale);
    panel.gap = m_theme.spacing * m_scale;
    m_panels.push_back(panel);
}

void UiSystem::EndPanel()
{
    if (!m_panels.empty())
    {
        m_panels.pop_back();
    }
}

UiRect UiSystem::CurrentContentRect() const
{
    return m_panels.empty() ? UiRect{} : m_panels.back().content;
}

UiRect UiSystem::AllocateRect(float height, float width)
{
    if (m_panels.empty())
    {
        return UiRect{};
    }
    Panel& panel = m_panels.back();
    UiRect row{panel.content.x, panel.content.y + panel.used, panel.content.w, std::max(1.0F, height * m_scale)};
    if (width > 0.0F)
    {
        row.w = width * m_scale;
    }
    panel.used += row.h + panel.gap;
    return row;
}

UiRect UiSystem::AllocateRemaining(float reserveBelow)
{
    if (m_panels.empty())
    {
        return UiRect{};
    }
    const Panel& panel = m_panels.back();
    const float height = panel.content.h - panel.used - reserveBelow * m_scale - panel.gap;
    return AllocateRect(std::max(1.0F, height) / m_scale);
}

UiSystem::Interaction UiSystem::Interact(const std::string& id, const UiRect& rect)
{
    m_widgetRects.push_back(rect);

    Interaction result;
    if (!m_interactive)
    {
        return result;
    }
    result.hovered = rect.Contains(m_pointer.position.x, m_pointer.position.y);
    if (result.hovered && m_pointer.pressed)
    {
        m_activeId = id;
    }
    const bool active = m_activeId == id;
    result.held = active && m_pointer.down;
    result.clicked = active && result.hovered && m_pointer.released;
    return result;
}

void UiSystem::Label(const std::string& text, const glm::vec4& color, float fontScale)
{
    const UiRect row = AllocateRect(std::max(20.0F, LineHeight(fontScale) / m_scale + 4.0F));
    DrawTextLabel(row.x, row.y + 2.0F, text, color, fontScale);
}

void UiSystem::Label(const std::string& text, float fontScale)
{
    Label(text, m_theme.colorText, fontScale);
}

bool UiSystem::Button(const std::string& id, const std::string& label, float width)
{
    return ButtonAt(id, label, AllocateRect(kButtonHeight, width));
}

bool UiSystem::ButtonAt(const std::string& id, const std::string& label, const UiRect& rect, bool* outHeld)
{
    const Interaction state = Interact(id, rect);
    if (outHeld != nullptr)
    {
        *outHeld = state.held && state.hovered;
    }

    const glm::vec4& fill = state.held ? m_theme.colorButtonPressed : (state.hovered ? m_theme.colorButtonHover : m_theme.colorButton);
    DrawRect(rect, fill);
    DrawRectOutline(rect, 1.0F, m_theme.colorPanelBorder);
    const glm::vec2 textPos{rect.x + (rect.w - TextWidth(label)) * 0.5F, rect.y + (rect.h - LineHeight()) * 0.5F};
    DrawTextLabel(textPos.x, textPos.y, label, m_theme.colorText);
    return state.clicked;
}

bool UiSystem::SliderFloat(const std::string& id, float* value, float minValue, float maxValue, const char* format)
{
    const UiRect track = AllocateRect(kSliderHeight);
    const Interaction state = Interact(id, track);
    if (value == nullptr || maxValue <= minValue)
    {
        DrawRect(track, m_theme.colorButton);
        return false;
    }

    bool changed = false;
    if (state.held)
    {
        const float fraction = std::clamp((m_pointer.position.x - track.x) / track.w, 0.0F, 1.0F);
        const float dragged = minValue + (maxValue - minValue) * fraction;
        changed = dragged != *value;
        *value = dragged;
    }
    const float fill = std::clamp((*value - minValue) / (maxValue - minValue), 0.0F, 1.0F);

    DrawRect(track, state.hovered ? m_theme.colorButtonHover : m_theme.colorButton);
    DrawRect(UiRect{track.x, track.y, track.w * fill, track.h}, m_theme.colorAccent);
    const float knobWidth = 6.0F * m_scale;
    DrawRect(UiRect{track.x + track.w * fill - knobWidth * 0.5F, track.y, knobWidth, track.h}, m_theme.colorText);
    DrawRectOutline(track, 1.0F, m_theme.colorPanelBorder);

    char text[64]{};
    std::snprintf(text, sizeof(text), format != nullptr ? format : "%.2f", *value);
    const float margin = 6.0F * m_scale;
    DrawTextLabel(track.x + track.w - TextWidth(text) - margin, track.y + (track.h - LineHeight()) * 0.5F, text, m_theme.colorText);
    return changed;
}

void UiSystem::DrawRect(const UiRect& rect, const glm::vec4& color)
{
    PushQuad(rect, color, glm::vec4{0.0F}, 0.0F);
}

void UiSystem::DrawRectOutline(const UiRect& rect, float thickness, const glm::vec4& color)
{
    const float edge = std::max(1.0F, thickness * m_scale);
    DrawRect(UiRect{rect.x, rect.y, rect.w, edge}, color);
    DrawRect(UiRect{rect.x, rect.y + rect.h - edge, rect.w, edge}, color);
    DrawRect(UiRect{rect.x, rect.y + edge, edge, rect.h - edge * 2.0F}, color);
    DrawRect(UiRect{rect.x + rect.w - edge, rect.y + edge, edge, rect.h - edge * 2.0F}, color);
}

float UiSystem::FontPixels(float fontScale) const
{
    return m_theme.baseFontSize * m_scale * std::max(0.5F, fontScale);
}

float UiSystem::LineHeight(float fontScale) const
{
    return m_font.LineHeight(FontPixels(fontScale));
}

float UiSystem::TextWidth(std::string_view text, float fontScale) const
{
    return m_font.Measure(text, FontPixels(fontScale));
}

void UiSystem::DrawTextLabel(float x, float y, std::string_view text, const glm::vec4& color, float fontScale)
{
    for (const FontAtlas::GlyphQuad& quad : m_font.Layout(text, glm::vec2{x, y}, FontPixels(fontScale)))
    {
        PushQuad(UiRect{quad.bounds.x, quad.bounds.y, quad.bounds.z, quad.bounds.w}, color, quad.uv, 1.0F);
    }
}

void UiSystem::PushQuad(const UiRect& rect, const glm::vec4& color, const glm::vec4& uv, float glyph)
{
    const Vertex topLeft{glm::vec2{rect.x, rect.y}, glm::vec2{uv.x, uv.y}, color, glyph};
    const Vertex topRight{glm::vec2{rect.x + rect.w, rect.y}, glm::vec2{uv.z, uv.y}, color, glyph};
    const Vertex bottomRight{glm::vec2{rect.x + rect.w, rect.y + rect.h}, glm::vec2{uv.z, uv.w}, color, glyph};
    const Vertex bottomLeft{glm::vec2{rect.x, rect.y + rect.h}, glm::vec2{uv.x, uv.w}, color, glyph};
    m_vertices.insert(m_vertices.end(), {topLeft, topRight, bottomRight, topLeft, bottomRight, bottomLeft});
}
} // namespace engine::ui
