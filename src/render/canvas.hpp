#pragma once

#include <barrace/color.hpp>
#include <barrace/render_plan.hpp>
#include <barrace/renderer.hpp>

#include <cstdint>
#include <utility>

namespace barrace
{

// Software RGBA8 raster with source-over blending and anti-aliased edges.
// Shapes take fractional pixel coordinates; partially covered pixels are
// blended by their covered area.
class Canvas
{
   public:
    Canvas(uint32_t width, uint32_t height);

    uint32_t width() const { return buffer_.width; }
    uint32_t height() const { return buffer_.height; }

    void clear(const Color& color);

    // Blend color into one pixel, weighted by coverage in [0, 1].
    void blend_pixel(int x, int y, const Color& color, float coverage = 1.0f);

    void fill_rect(const Rect& rect, const Color& color);
    void fill_rounded_rect(const Rect& rect, float radius, const Color& color);

    // Vertical line of the given thickness centred on x.
    void vline(float x, float y0, float y1, float thickness, const Color& color);

    // 8-bit coverage mask tinted with color, top-left corner at (dst_x, dst_y).
    void blit_mask(const uint8_t* mask, int w, int h, int stride, int dst_x, int dst_y, const Color& color);

    // Straight-alpha RGBA image, top-left corner at (dst_x, dst_y).
    void blit_rgba(const uint8_t* rgba, int w, int h, int dst_x, int dst_y);

    const PixelBuffer& buffer() const { return buffer_; }
    PixelBuffer        release() { return std::move(buffer_); }

   private:
    PixelBuffer buffer_;
};

}  // namespace barrace
