#pragma once

#include <barrace/color.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace barrace
{

enum class TextAlign : uint8_t
{
    Left = 0,
    Center,
    Right,
};

enum class TextVAlign : uint8_t
{
    Top = 0,
    Middle,
    Bottom,
};

// Text styles of a bar race frame. Point sizes live in the text renderer.
enum class FontRole : uint8_t
{
    GridLabel = 0,   // gridline percentages
    Attribution,     // data source line
    Percent,         // value next to each bar
    Name,            // series name left of each bar
    Timestamp,       // frame date
    Notice,          // placeholder message
    Title,
    Count,
};

// Pixel rectangle, origin top-left, y down.
struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

struct TextPlacement
{
    std::string text;
    float       x      = 0.0f;
    float       y      = 0.0f;
    FontRole    role   = FontRole::Name;
    Color       color  = colors::white;
    TextAlign   align  = TextAlign::Left;
    TextVAlign  valign = TextVAlign::Middle;
};

struct GridlinePlacement
{
    double        value    = 0.0;
    float         x        = 0.0f;
    float         y_top    = 0.0f;
    float         y_bottom = 0.0f;
    float         width    = 1.0f;
    Color         color;
    TextPlacement label;
};

struct BarPlacement
{
    std::string   series;
    double        value = 0.0;
    float         slot  = 0.0f;
    Rect          bar;
    float         corner_radius = 0.0f;
    Color         color;
    bool          highlighted = false;
    Rect          highlight;
    Color         highlight_color;
    TextPlacement name;
    TextPlacement percent;
};

// Bottom-left anchor of the logo and the height it is drawn at.
struct LogoPlacement
{
    bool  visible       = true;
    float x             = 0.0f;
    float bottom        = 0.0f;
    float target_height = 0.0f;
};

// Everything needed to paint one frame; produced by layout_frame().
struct RenderPlan
{
    uint32_t width  = 0;
    uint32_t height = 0;
    Color    background;

    double max_value = 0.0;
    double grid_step = 0.0;

    std::vector<GridlinePlacement> gridlines;
    std::vector<BarPlacement>      bars;

    std::vector<TextPlacement> headings;   // title
    std::vector<TextPlacement> footers;    // timestamp, attribution
    LogoPlacement              logo;
};

}  // namespace barrace
