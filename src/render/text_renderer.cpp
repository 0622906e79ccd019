#include "text_renderer.hpp"

#include "canvas.hpp"

#include <cmath>
#include <fstream>

#include "stb_truetype.h"

namespace barrace
{

// Point sizes per FontRole, in enum order.
static constexpr float FONT_POINT_SIZES[] = {
    11.0f,   // GridLabel
    10.0f,   // Attribution
    14.0f,   // Percent
    16.0f,   // Name
    16.0f,   // Timestamp
    20.0f,   // Notice
    32.0f,   // Title
};
static_assert(sizeof(FONT_POINT_SIZES) / sizeof(FONT_POINT_SIZES[0])
              == static_cast<size_t>(FontRole::Count));

// Latin-1: space through y-diaeresis. Glyphs are copied 1:1, no oversampling.
static constexpr int FIRST_CHAR = 32;
static constexpr int NUM_CHARS  = 224;   // 32..255 inclusive

static constexpr uint32_t ATLAS_SIZE = 2048;

TextRenderer::TextRenderer() = default;

TextRenderer::~TextRenderer() = default;

float TextRenderer::point_size(FontRole role)
{
    return FONT_POINT_SIZES[static_cast<size_t>(role)];
}

bool TextRenderer::init(const uint8_t* font_data, size_t font_data_size, float dpi)
{
    if (!font_data || font_data_size < 12 || dpi <= 0.0f)
        return false;

    // TrueType: 00 01 00 00, OpenType: 'OTTO', TTC: 'ttcf'
    uint32_t tag =
        (static_cast<uint32_t>(font_data[0]) << 24) | (static_cast<uint32_t>(font_data[1]) << 16)
        | (static_cast<uint32_t>(font_data[2]) << 8) | static_cast<uint32_t>(font_data[3]);
    bool valid_sig = (tag == 0x00010000u) || (tag == 0x4F54544Fu) || (tag == 0x74746366u);
    if (!valid_sig)
        return false;

    stbtt_fontinfo font_info;
    int            offset = stbtt_GetFontOffsetForIndex(font_data, 0);
    if (offset < 0)
        return false;
    if (!stbtt_InitFont(&font_info, font_data, offset))
        return false;

    atlas_width_  = ATLAS_SIZE;
    atlas_height_ = ATLAS_SIZE;
    atlas_.assign(static_cast<size_t>(atlas_width_) * atlas_height_, 0);

    stbtt_pack_context pack_ctx;
    if (!stbtt_PackBegin(&pack_ctx,
                         atlas_.data(),
                         static_cast<int>(atlas_width_),
                         static_cast<int>(atlas_height_),
                         0,   // tightly packed
                         1,   // padding between glyphs
                         nullptr))
    {
        return false;
    }
    stbtt_PackSetOversampling(&pack_ctx, 1, 1);

    static constexpr size_t ROLE_COUNT = static_cast<size_t>(FontRole::Count);
    std::vector<stbtt_packedchar> chardata(ROLE_COUNT * NUM_CHARS);

    stbtt_pack_range ranges[ROLE_COUNT];
    for (size_t ri = 0; ri < ROLE_COUNT; ++ri)
    {
        // Points to pixels at the render dpi
        fonts_[ri].pixel_size = FONT_POINT_SIZES[ri] * dpi / 72.0f;

        ranges[ri].font_size                        = fonts_[ri].pixel_size;
        ranges[ri].first_unicode_codepoint_in_range = FIRST_CHAR;
        ranges[ri].num_chars                        = NUM_CHARS;
        ranges[ri].chardata_for_range               = chardata.data() + ri * NUM_CHARS;
        ranges[ri].array_of_unicode_codepoints      = nullptr;
    }

    int pack_ok = stbtt_PackFontRanges(&pack_ctx, font_data, 0, ranges, static_cast<int>(ROLE_COUNT));
    stbtt_PackEnd(&pack_ctx);

    if (!pack_ok)
        return false;

    int ascent_i, descent_i, line_gap_i;
    stbtt_GetFontVMetrics(&font_info, &ascent_i, &descent_i, &line_gap_i);

    for (size_t ri = 0; ri < ROLE_COUNT; ++ri)
    {
        float scale        = stbtt_ScaleForPixelHeight(&font_info, fonts_[ri].pixel_size);
        fonts_[ri].ascent  = static_cast<float>(ascent_i) * scale;
        fonts_[ri].descent = static_cast<float>(descent_i) * scale;

        for (int ci = 0; ci < NUM_CHARS; ++ci)
        {
            const stbtt_packedchar& pc = chardata[ri * NUM_CHARS + ci];

            GlyphInfo gi{};
            gi.atlas_x   = pc.x0;
            gi.atlas_y   = pc.y0;
            gi.width     = pc.x1 - pc.x0;
            gi.height    = pc.y1 - pc.y0;
            gi.x_offset  = pc.xoff;
            gi.y_offset  = pc.yoff;
            gi.x_advance = pc.xadvance;

            fonts_[ri].glyphs[static_cast<uint32_t>(FIRST_CHAR + ci)] = gi;
        }
    }

    initialized_ = true;
    return true;
}

bool TextRenderer::init_from_file(const std::string& ttf_path, float dpi)
{
    std::ifstream file(ttf_path, std::ios::binary | std::ios::ate);
    if (!file.is_open())
        return false;

    auto size = file.tellg();
    if (size <= 0)
        return false;

    std::vector<uint8_t> data(static_cast<size_t>(size));
    file.seekg(0, std::ios::beg);
    if (!file.read(reinterpret_cast<char*>(data.data()), size))
        return false;

    // stb_truetype only reads the file while the atlas is baked
    return init(data.data(), data.size(), dpi);
}

const GlyphInfo* TextRenderer::glyph(const FontData& f, uint32_t codepoint) const
{
    auto it = f.glyphs.find(codepoint);
    if (it != f.glyphs.end())
        return &it->second;
    it = f.glyphs.find('?');
    return it != f.glyphs.end() ? &it->second : nullptr;
}

TextRenderer::TextExtent TextRenderer::measure_text(const std::string& text, FontRole role) const
{
    const auto& fd    = font(role);
    float       width = 0.0f;

    for (uint32_t cp : decode_utf8(text))
    {
        if (const GlyphInfo* g = glyph(fd, cp))
            width += g->x_advance;
    }

    return {width, fd.ascent - fd.descent};
}

void TextRenderer::draw_text(Canvas& canvas, const TextPlacement& text) const
{
    if (!initialized_ || text.text.empty())
        return;

    const auto& fd = font(text.role);

    float offset_x = 0.0f;
    float offset_y = 0.0f;

    if (text.align != TextAlign::Left)
    {
        auto ext = measure_text(text.text, text.role);
        if (text.align == TextAlign::Center)
            offset_x = -ext.width * 0.5f;
        else if (text.align == TextAlign::Right)
            offset_x = -ext.width;
    }

    const float line_height = fd.ascent - fd.descent;
    if (text.valign == TextVAlign::Middle)
        offset_y = -line_height * 0.5f;
    else if (text.valign == TextVAlign::Bottom)
        offset_y = -line_height;

    // Cursor on the baseline; packed glyph offsets are baseline-relative.
    float cursor_x = text.x + offset_x;
    float cursor_y = text.y + offset_y + fd.ascent;

    for (uint32_t cp : decode_utf8(text.text))
    {
        const GlyphInfo* g = glyph(fd, cp);
        if (!g)
            continue;

        if (g->width > 0 && g->height > 0)
        {
            const uint8_t* src = atlas_.data() + static_cast<size_t>(g->atlas_y) * atlas_width_ + g->atlas_x;
            canvas.blit_mask(src,
                             g->width,
                             g->height,
                             static_cast<int>(atlas_width_),
                             static_cast<int>(std::lround(cursor_x + g->x_offset)),
                             static_cast<int>(std::lround(cursor_y + g->y_offset)),
                             text.color);
        }
        cursor_x += g->x_advance;
    }
}

std::vector<uint32_t> decode_utf8(const std::string& text)
{
    constexpr uint32_t kReplacement = 0xFFFD;

    std::vector<uint32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size())
    {
        auto     c     = static_cast<unsigned char>(text[i]);
        uint32_t cp    = 0;
        int      extra = 0;

        if (c < 0x80)
        {
            cp = c;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            cp    = c & 0x1F;
            extra = 1;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            cp    = c & 0x0F;
            extra = 2;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            cp    = c & 0x07;
            extra = 3;
        }
        else
        {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        if (i + static_cast<size_t>(extra) >= text.size())
        {
            out.push_back(kReplacement);
            break;
        }

        bool ok = true;
        for (int k = 1; k <= extra; ++k)
        {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80)
            {
                ok = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!ok)
        {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += static_cast<size_t>(extra) + 1;
    }

    return out;
}

}  // namespace barrace
