#pragma once

#include <barrace/render_plan.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace barrace
{

class Canvas;

struct GlyphInfo
{
    int   atlas_x, atlas_y;   // top-left of the glyph bitmap in the atlas
    int   width, height;      // glyph bitmap size in pixels
    float x_offset;           // horizontal offset from cursor to glyph left edge
    float y_offset;           // vertical offset from baseline to glyph top edge
    float x_advance;          // horizontal advance after this glyph
};

// CPU text rasterizer: one stb_truetype glyph atlas holding every FontRole at
// its point size for the render dpi.
//
// After init() the renderer is immutable, so one instance can be shared by all
// frames of a render.
class TextRenderer
{
   public:
    TextRenderer();
    ~TextRenderer();

    TextRenderer(const TextRenderer&)            = delete;
    TextRenderer& operator=(const TextRenderer&) = delete;

    // Bake the atlas from TTF/OTF bytes. Returns false for data stb_truetype
    // cannot use.
    bool init(const uint8_t* font_data, size_t font_data_size, float dpi);

    // Convenience: load the font file first.
    bool init_from_file(const std::string& ttf_path, float dpi);

    bool is_initialized() const { return initialized_; }

    // Point size of a role and its pixel size at the baked dpi.
    static float point_size(FontRole role);
    float        pixel_size(FontRole role) const { return font(role).pixel_size; }
    float        ascent(FontRole role) const { return font(role).ascent; }
    float        descent(FontRole role) const { return font(role).descent; }

    struct TextExtent
    {
        float width;
        float height;
    };
    TextExtent measure_text(const std::string& text, FontRole role) const;

    void draw_text(Canvas& canvas, const TextPlacement& text) const;

   private:
    struct FontData
    {
        float                                   pixel_size = 0.0f;
        float                                   ascent     = 0.0f;
        float                                   descent    = 0.0f;
        std::unordered_map<uint32_t, GlyphInfo> glyphs;   // codepoint -> glyph
    };

    const FontData&  font(FontRole r) const { return fonts_[static_cast<size_t>(r)]; }
    const GlyphInfo* glyph(const FontData& f, uint32_t codepoint) const;

    FontData             fonts_[static_cast<size_t>(FontRole::Count)];
    std::vector<uint8_t> atlas_;
    uint32_t             atlas_width_  = 0;
    uint32_t             atlas_height_ = 0;
    bool                 initialized_  = false;
};

// Decode UTF-8 into codepoints; malformed bytes become U+FFFD.
std::vector<uint32_t> decode_utf8(const std::string& text);

}  // namespace barrace
