#pragma once

#include <cstdint>

namespace barrace
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    constexpr Color with_alpha(float alpha) const { return Color{r, g, b, alpha}; }
};

inline constexpr Color rgb(float r, float g, float b)
{
    return Color{r, g, b, 1.0f};
}

inline constexpr Color rgba(float r, float g, float b, float a)
{
    return Color{r, g, b, a};
}

// 0xRRGGBB
inline constexpr Color from_hex(uint32_t hex, float alpha = 1.0f)
{
    return Color{static_cast<float>((hex >> 16) & 0xFF) / 255.0f,
                 static_cast<float>((hex >> 8) & 0xFF) / 255.0f,
                 static_cast<float>(hex & 0xFF) / 255.0f,
                 alpha};
}

namespace colors
{
inline constexpr Color black{0.0f, 0.0f, 0.0f};
inline constexpr Color white{1.0f, 1.0f, 1.0f};
}  // namespace colors

// Chart palette shared by every frame of a bar race.
namespace theme
{
inline constexpr Color background = from_hex(0x0a1929);
inline constexpr Color bar        = from_hex(0x5ac8fa);
inline constexpr Color text_white = from_hex(0xffffff);
inline constexpr Color text_cyan  = from_hex(0x5ac8fa);
inline constexpr Color text_gray  = from_hex(0x6b8299);
inline constexpr Color gridline   = from_hex(0x1a3a5c);
}  // namespace theme

}  // namespace barrace
