#include "engine/ui/FontAtlas.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <utility>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace engine::ui
{
bool FontAtlas::LoadFromFile(const std::string& path, std::string* outError)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Failed to open font " + path;
        }
        return false;
    }
    std::vector<unsigned char> data{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (!Bake(std::move(data), outError))
    {
        if (outError != nullptr)
        {
            *outError += " (" + path + ")";
        }
        return false;
    }
    return true;
}

bool FontAtlas::Bake(std::vector<unsigned char> fontData, std::string* outError)
{
    if (fontData.empty())
    {
        if (outError != nullptr)
        {
            *outError = "Font file is empty";
        }
        return false;
    }

    std::vector<unsigned char> bitmap(static_cast<std::size_t>(kAtlasSize) * kAtlasSize);
    std::array<stbtt_bakedchar, kCharCount> baked{};
    const int rows = stbtt_BakeFontBitmap(fontData.data(), 0, kBakeHeight, bitmap.data(), kAtlasSize, kAtlasSize, kFirstChar, kCharCount, baked.data());
    if (rows <= 0)
    {
        if (outError != nullptr)
        {
            *outError = "Font does not fit the glyph atlas";
        }
        return false;
    }

    std::vector<Glyph> glyphs;
    glyphs.reserve(baked.size());
    float top = 0.0F;
    float bottom = 0.0F;
    for (const stbtt_bakedchar& ch : baked)
    {
        Glyph glyph;
        glyph.atlas = glm::vec4{ch.x0, ch.y0, ch.x1, ch.y1};
        glyph.offset = glm::vec2{ch.xoff, ch.yoff};
        glyph.advance = ch.xadvance;
        top = std::min(top, ch.yoff);
        bottom = std::max(bottom, ch.yoff + static_cast<float>(ch.y1 - ch.y0));
        glyphs.push_back(glyph);
    }

    m_fontData = std::move(fontData);
    m_bitmap = std::move(bitmap);
    m_glyphs = std::move(glyphs);
    m_baseline = -top;
    m_lineHeight = std::max(1.0F, bottom - top);
    return true;
}

void FontAtlas::ReleaseBitmap()
{
    m_bitmap.clear();
    m_bitmap.shrink_to_fit();
}

const FontAtlas::Glyph* FontAtlas::Find(char ch) const
{
    const int index = static_cast<int>(static_cast<unsigned char>(ch)) - kFirstChar;
    if (index < 0 || index >= static_cast<int>(m_glyphs.size()))
    {
        return nullptr;
    }
    return &m_glyphs[static_cast<std::size_t>(index)];
}

float FontAtlas::LineHeight(float pixelHeight) const
{
    return std::max(1.0F, m_lineHeight * pixelHeight / kBakeHeight);
}

float FontAtlas::Measure(std::string_view text, float pixelHeight) const
{
    const float scale = pixelHeight / kBakeHeight;
    float widest = 0.0F;
    float line = 0.0F;
    for (const char ch : text)
    {
        if (ch == '\n')
        {
            widest = std::max(widest, line);
            line = 0.0F;
            continue;
        }
        const Glyph* glyph = Find(ch);
        line += glyph != nullptr ? glyph->advance * scale : pixelHeight * 0.5F;
    }
    return std::max(widest, line);
}

std::vector<FontAtlas::GlyphQuad> FontAtlas::Layout(std::string_view text, const glm::vec2& topLeft, float pixelHeight) const
{
    std::vector<GlyphQuad> quads;
    if (!IsLoaded())
    {
        return quads;
    }
    quads.reserve(text.size());

    const float scale = pixelHeight / kBakeHeight;
    const float invAtlas = 1.0F / static_cast<float>(kAtlasSize);
    glm::vec2 pen{topLeft.x, topLeft.y + m_baseline * scale};
    for (const char ch : text)
    {
        if (ch == '\n')
        {
            pen = glm::vec2{topLeft.x, pen.y + LineHeight(pixelHeight)};
            continue;
        }
        const Glyph* glyph = Find(ch);
        if (glyph == nullptr)
        {
            pen.x += pixelHeight * 0.5F;
            continue;
        }
        const glm::vec2 size{(glyph->atlas.z - glyph->atlas.x) * scale, (glyph->atlas.w - glyph->atlas.y) * scale};
        if (size.x > 0.0F && size.y > 0.0F)
        {
            GlyphQuad quad;
            quad.bounds = glm::vec4{pen + glyph->offset * scale, size};
            quad.uv = glyph->atlas * invAtlas;
            quads.push_back(quad);
        }
        pen.x += glyph->advance * scale;
    }
    return quads;
}
} // namespace engine::ui
