#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace barrace
{

enum class ChartFormat
{
    Square,   // 1080x1080 at 100 dpi
};

struct FormatSpec
{
    uint32_t width  = 1080;
    uint32_t height = 1080;
    float    dpi    = 100.0f;
};

FormatSpec                 format_spec(ChartFormat format);
std::optional<ChartFormat> parse_chart_format(std::string_view name);
const char*                chart_format_name(ChartFormat format);

// Options recognised for one bar race render.
struct ChartOptions
{
    std::string title;
    int         max_candidates = 8;      // first N of the display order
    int         fps            = 30;
    double      duration       = 8.0;    // seconds
    ChartFormat format         = ChartFormat::Square;
    bool        show_gridlines = true;

    // Display order. Empty = every table series, in table order.
    std::vector<std::string> series;

    std::string attribution = "PER NOVIG MARKET DATA";
};

// Largest frame count a render may request.
inline constexpr uint32_t kMaxFrameCount = std::numeric_limits<uint32_t>::max();

// Throws InvalidConfigurationError for non-positive fps, duration or
// max_candidates, or when fps * duration exceeds kMaxFrameCount.
void validate_options(const ChartOptions& options);

// round(fps * duration), never less than one.
uint32_t frame_count_for(int fps, double duration);

// Index shown by a preview when none is given: 80% through the sequence,
// clamped to the last frame.
uint32_t default_preview_frame(uint32_t frame_count, double frame_position = 0.8);

// Immutable per-render settings consumed by the layout engine.
struct RenderConfig
{
    uint32_t                 width          = 1080;
    uint32_t                 height         = 1080;
    float                    dpi            = 100.0f;
    bool                     show_gridlines = true;
    std::string              title;   // already upper-cased
    std::string              attribution;
    std::vector<std::string> series;   // display order
};

RenderConfig make_render_config(const ChartOptions& options, std::vector<std::string> series);

}  // namespace barrace
