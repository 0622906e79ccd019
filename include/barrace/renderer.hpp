#pragma once

#include <barrace/render_plan.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace barrace
{

class TextRenderer;

// Tightly packed RGBA8 image, row 0 at the top.
struct PixelBuffer
{
    uint32_t             width  = 0;
    uint32_t             height = 0;
    std::vector<uint8_t> rgba;

    PixelBuffer() = default;
    PixelBuffer(uint32_t w, uint32_t h) : width(w), height(h), rgba(static_cast<size_t>(w) * h * 4, 0) {}

    size_t byte_size() const { return rgba.size(); }

    const uint8_t* pixel(uint32_t x, uint32_t y) const
    {
        return rgba.data() + (static_cast<size_t>(y) * width + x) * 4;
    }
};

// Logo raster, pure white with binary alpha, already at display height.
struct LogoImage
{
    uint32_t             width  = 0;
    uint32_t             height = 0;
    std::vector<uint8_t> rgba;

    bool empty() const { return width == 0 || height == 0; }
};

// Read-only assets shared by every frame of a render. Both are optional: a
// missing font skips text, a missing logo skips the logo.
struct RenderAssets
{
    std::shared_ptr<const TextRenderer> text;
    std::optional<LogoImage>            logo;
};

// Paints RenderPlans into pixel buffers.
//
// render() is const and touches nothing but its output, so one FrameRenderer
// may serve several threads once the eased positions are known.
class FrameRenderer
{
   public:
    FrameRenderer() = default;
    explicit FrameRenderer(RenderAssets assets);

    PixelBuffer render(const RenderPlan& plan) const;

    const RenderAssets& assets() const { return assets_; }

   private:
    RenderAssets assets_;
};

}  // namespace barrace
