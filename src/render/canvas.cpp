#include "canvas.hpp"

#include <algorithm>
#include <cmath>

namespace barrace
{

namespace
{

uint8_t to_byte(float v)
{
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

// Length of [a0, a1) that falls inside the unit cell starting at cell.
float overlap(float a0, float a1, int cell)
{
    float lo = std::max(a0, static_cast<float>(cell));
    float hi = std::min(a1, static_cast<float>(cell + 1));
    return std::max(0.0f, hi - lo);
}

}  // namespace

Canvas::Canvas(uint32_t width, uint32_t height) : buffer_(width, height) {}

void Canvas::clear(const Color& color)
{
    const uint8_t r = to_byte(color.r);
    const uint8_t g = to_byte(color.g);
    const uint8_t b = to_byte(color.b);
    const uint8_t a = to_byte(color.a);
    for (size_t i = 0; i < buffer_.rgba.size(); i += 4)
    {
        buffer_.rgba[i + 0] = r;
        buffer_.rgba[i + 1] = g;
        buffer_.rgba[i + 2] = b;
        buffer_.rgba[i + 3] = a;
    }
}

void Canvas::blend_pixel(int x, int y, const Color& color, float coverage)
{
    if (x < 0 || y < 0 || x >= static_cast<int>(buffer_.width) || y >= static_cast<int>(buffer_.height))
        return;

    const float sa = std::clamp(color.a * coverage, 0.0f, 1.0f);
    if (sa <= 0.0f)
        return;

    uint8_t* px = buffer_.rgba.data() + (static_cast<size_t>(y) * buffer_.width + x) * 4;

    const float inv = 1.0f - sa;
    px[0]           = to_byte(color.r * sa + (px[0] / 255.0f) * inv);
    px[1]           = to_byte(color.g * sa + (px[1] / 255.0f) * inv);
    px[2]           = to_byte(color.b * sa + (px[2] / 255.0f) * inv);
    px[3]           = to_byte(sa + (px[3] / 255.0f) * inv);
}

void Canvas::fill_rect(const Rect& rect, const Color& color)
{
    if (rect.w <= 0.0f || rect.h <= 0.0f)
        return;

    const float x0 = rect.x;
    const float y0 = rect.y;
    const float x1 = rect.x + rect.w;
    const float y1 = rect.y + rect.h;

    const int ix0 = std::max(0, static_cast<int>(std::floor(x0)));
    const int iy0 = std::max(0, static_cast<int>(std::floor(y0)));
    const int ix1 = std::min(static_cast<int>(buffer_.width), static_cast<int>(std::ceil(x1)));
    const int iy1 = std::min(static_cast<int>(buffer_.height), static_cast<int>(std::ceil(y1)));

    for (int y = iy0; y < iy1; ++y)
    {
        const float cy = overlap(y0, y1, y);
        for (int x = ix0; x < ix1; ++x)
            blend_pixel(x, y, color, cy * overlap(x0, x1, x));
    }
}

void Canvas::fill_rounded_rect(const Rect& rect, float radius, const Color& color)
{
    if (rect.w <= 0.0f || rect.h <= 0.0f)
        return;

    const float half_w = rect.w * 0.5f;
    const float half_h = rect.h * 0.5f;
    const float r      = std::clamp(radius, 0.0f, std::min(half_w, half_h));
    if (r <= 0.0f)
    {
        fill_rect(rect, color);
        return;
    }

    const float cx = rect.x + half_w;
    const float cy = rect.y + half_h;

    const int ix0 = std::max(0, static_cast<int>(std::floor(rect.x)));
    const int iy0 = std::max(0, static_cast<int>(std::floor(rect.y)));
    const int ix1 = std::min(static_cast<int>(buffer_.width), static_cast<int>(std::ceil(rect.x + rect.w)));
    const int iy1 = std::min(static_cast<int>(buffer_.height), static_cast<int>(std::ceil(rect.y + rect.h)));

    for (int y = iy0; y < iy1; ++y)
    {
        for (int x = ix0; x < ix1; ++x)
        {
            // Signed distance from the pixel centre to the rounded outline
            const float qx   = std::fabs(static_cast<float>(x) + 0.5f - cx) - (half_w - r);
            const float qy   = std::fabs(static_cast<float>(y) + 0.5f - cy) - (half_h - r);
            const float ox   = std::max(qx, 0.0f);
            const float oy   = std::max(qy, 0.0f);
            const float dist = std::sqrt(ox * ox + oy * oy) + std::min(std::max(qx, qy), 0.0f) - r;

            float coverage = std::clamp(0.5f - dist, 0.0f, 1.0f);
            // Straight edges keep exact area coverage
            coverage = std::min(coverage, overlap(rect.x, rect.x + rect.w, x) * overlap(rect.y, rect.y + rect.h, y));
            if (coverage > 0.0f)
                blend_pixel(x, y, color, coverage);
        }
    }
}

void Canvas::vline(float x, float y0, float y1, float thickness, const Color& color)
{
    if (y1 < y0)
        std::swap(y0, y1);
    fill_rect(Rect{x - thickness * 0.5f, y0, thickness, y1 - y0}, color);
}

void Canvas::blit_mask(const uint8_t* mask, int w, int h, int stride, int dst_x, int dst_y, const Color& color)
{
    if (!mask || w <= 0 || h <= 0)
        return;

    for (int j = 0; j < h; ++j)
    {
        const uint8_t* row = mask + static_cast<size_t>(j) * stride;
        for (int i = 0; i < w; ++i)
        {
            if (row[i] > 0)
                blend_pixel(dst_x + i, dst_y + j, color, row[i] / 255.0f);
        }
    }
}

void Canvas::blit_rgba(const uint8_t* rgba, int w, int h, int dst_x, int dst_y)
{
    if (!rgba || w <= 0 || h <= 0)
        return;

    for (int j = 0; j < h; ++j)
    {
        for (int i = 0; i < w; ++i)
        {
            const uint8_t* src = rgba + (static_cast<size_t>(j) * w + i) * 4;
            if (src[3] == 0)
                continue;
            blend_pixel(dst_x + i,
                        dst_y + j,
                        Color{src[0] / 255.0f, src[1] / 255.0f, src[2] / 255.0f, src[3] / 255.0f});
        }
    }
}

}  // namespace barrace
