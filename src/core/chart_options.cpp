#include <barrace/chart_options.hpp>
#include <barrace/error.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace barrace
{

FormatSpec format_spec(ChartFormat format)
{
    switch (format)
    {
        case ChartFormat::Square:
            return FormatSpec{1080, 1080, 100.0f};
    }
    return FormatSpec{};
}

std::optional<ChartFormat> parse_chart_format(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "square")
        return ChartFormat::Square;
    return std::nullopt;
}

const char* chart_format_name(ChartFormat format)
{
    switch (format)
    {
        case ChartFormat::Square:
            return "square";
    }
    return "unknown";
}

void validate_options(const ChartOptions& options)
{
    if (options.fps <= 0)
        throw InvalidConfigurationError("fps must be positive, got " + std::to_string(options.fps));
    if (!(options.duration > 0.0) || !std::isfinite(options.duration))
        throw InvalidConfigurationError("duration must be a positive number of seconds");
    if (std::round(static_cast<double>(options.fps) * options.duration) > static_cast<double>(kMaxFrameCount))
        throw InvalidConfigurationError("fps * duration exceeds the frame limit");
    if (options.max_candidates <= 0)
    {
        throw InvalidConfigurationError("max_candidates must be positive, got "
                                        + std::to_string(options.max_candidates));
    }
}

uint32_t frame_count_for(int fps, double duration)
{
    if (fps <= 0 || !(duration > 0.0))
        return 0;
    double n = std::round(static_cast<double>(fps) * duration);
    if (n < 1.0)
        return 1u;
    return n >= static_cast<double>(kMaxFrameCount) ? kMaxFrameCount : static_cast<uint32_t>(n);
}

uint32_t default_preview_frame(uint32_t frame_count, double frame_position)
{
    if (frame_count == 0)
        return 0;
    frame_position = std::clamp(frame_position, 0.0, 1.0);
    auto index     = static_cast<uint32_t>(std::floor(static_cast<double>(frame_count) * frame_position));
    return std::min(index, frame_count - 1);
}

RenderConfig make_render_config(const ChartOptions& options, std::vector<std::string> series)
{
    FormatSpec spec = format_spec(options.format);

    RenderConfig config;
    config.width          = spec.width;
    config.height         = spec.height;
    config.dpi            = spec.dpi;
    config.show_gridlines = options.show_gridlines;
    config.attribution    = options.attribution;
    config.series         = std::move(series);

    config.title = options.title;
    std::transform(config.title.begin(),
                   config.title.end(),
                   config.title.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return config;
}

}  // namespace barrace
