#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

namespace engine::ui
{
/// Printable ASCII baked into a single channel bitmap. Holds no GL state, the
/// owner uploads Bitmap() and drops it afterwards.
class FontAtlas
{
public:
    struct GlyphQuad
    {
        // x, y, w, h in UI pixels.
        glm::vec4 bounds{0.0F};
        // u0, v0, u1, v1.
        glm::vec4 uv{0.0F};
    };

    static constexpr int kAtlasSize = 512;
    static constexpr float kBakeHeight = 42.0F;
    static constexpr int kFirstChar = 32;
    static constexpr int kCharCount = 96;

    bool LoadFromFile(const std::string& path, std::string* outError = nullptr);
    bool Bake(std::vector<unsigned char> fontData, std::string* outError = nullptr);

    [[nodiscard]] bool IsLoaded() const { return !m_glyphs.empty(); }
    [[nodiscard]] const std::vector<unsigned char>& Bitmap() const { return m_bitmap; }
    void ReleaseBitmap();

    /// Widest line of |text| at |pixelHeight|. Without a font every character
    /// counts half the height.
    [[nodiscard]] float Measure(std::string_view text, float pixelHeight) const;
    [[nodiscard]] float LineHeight(float pixelHeight) const;
    [[nodiscard]] std::vector<GlyphQuad> Layout(std::string_view text, const glm::vec2& topLeft, float pixelHeight) const;

private:
    struct Glyph
    {
        // x0, y0, x1, y1 in atlas pixels.
        glm::vec4 atlas{0.0F};
        glm::vec2 offset{0.0F};
        float advance = 0.0F;
    };

    [[nodiscard]] const Glyph* Find(char ch) const;

    std::vector<unsigned char> m_fontData;
    std::vector<unsigned char> m_bitmap;
    std::vector<Glyph> m_glyphs;
    float m_baseline = kBakeHeight * 0.75F;
    float m_lineHeight = kBakeHeight;
};
} // namespace engine::ui
