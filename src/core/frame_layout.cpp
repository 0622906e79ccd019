#include <barrace/layout.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace barrace
{

namespace
{

// Maps canvas fractions (x from the left, y from the bottom) to pixels.
struct CanvasMap
{
    float width;
    float height;

    float x(float fx) const { return fx * width; }
    float y(float fy) const { return (1.0f - fy) * height; }
    float w(float fw) const { return fw * width; }
    float h(float fh) const { return fh * height; }
};

std::string to_upper_ascii(std::string s)
{
    std::transform(s.begin(),
                   s.end(),
                   s.begin(),
                   [](unsigned char c) { return c < 0x80 ? static_cast<char>(std::toupper(c)) : static_cast<char>(c); });
    return s;
}

// Cut a UTF-8 string after max_chars code points.
std::string truncate_utf8(const std::string& s, int max_chars)
{
    int count = 0;
    for (size_t i = 0; i < s.size(); ++i)
    {
        auto c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80)
        {
            if (count == max_chars)
                return s.substr(0, i);
            ++count;
        }
    }
    return s;
}

TextPlacement text_at(std::string text, float x, float y, FontRole role, Color color, TextAlign align, TextVAlign valign)
{
    TextPlacement t;
    t.text   = std::move(text);
    t.x      = x;
    t.y      = y;
    t.role   = role;
    t.color  = color;
    t.align  = align;
    t.valign = valign;
    return t;
}

}  // namespace

double axis_max(const Frame& frame)
{
    double peak = 0.0;
    bool   any  = false;
    for (const auto& [name, value] : frame.values)
    {
        if (value > 0.0)
        {
            peak = any ? std::max(peak, value) : value;
            any  = true;
        }
    }
    if (!any)
        peak = 0.1;
    return peak * chart_layout::headroom;
}

double grid_step_for(double max_value)
{
    if (max_value <= 0.1)
        return 0.02;
    if (max_value <= 0.25)
        return 0.05;
    if (max_value <= 0.5)
        return 0.1;
    return 0.2;
}

std::vector<double> gridline_values(double max_value, double step)
{
    std::vector<double> values;
    if (!(step > 0.0) || !(max_value > 0.0))
        return values;

    constexpr double kTolerance = 1e-9;
    for (int k = 1;; ++k)
    {
        double v = static_cast<double>(k) * step;
        if (v > max_value + kTolerance)
            break;
        values.push_back(v);
    }
    return values;
}

std::string format_percent(double value)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", value * 100.0);
    return buf;
}

std::string format_grid_label(double value)
{
    return std::to_string(std::lround(value * 100.0)) + "%";
}

std::string format_frame_date(Timestamp ts)
{
    auto   seconds = static_cast<std::time_t>(std::floor(ts));
    std::tm utc{};
    if (!gmtime_r(&seconds, &utc))
        return {};

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), "%B %d, %Y", &utc);
    return to_upper_ascii(std::string(buf, n));
}

std::string display_name(const std::string& series)
{
    return truncate_utf8(to_upper_ascii(series), chart_layout::name_chars);
}

RenderPlan layout_frame(const Frame& frame, const Positions& positions, const RenderConfig& config)
{
    namespace L = chart_layout;

    const CanvasMap cm{static_cast<float>(config.width), static_cast<float>(config.height)};

    RenderPlan plan;
    plan.width      = config.width;
    plan.height     = config.height;
    plan.background = theme::background;

    const double max_val = axis_max(frame);
    const double step    = grid_step_for(max_val);
    plan.max_value       = max_val;
    plan.grid_step       = step;

    const float bar_span   = L::bar_end_x - L::bar_start_x;
    const float chart_span = L::chart_top - L::chart_bottom;

    if (config.show_gridlines)
    {
        const float line_w = std::max(1.0f, std::round(config.dpi / 72.0f));
        for (double v : gridline_values(max_val, step))
        {
            float fx = L::bar_start_x + static_cast<float>(v / max_val) * bar_span;
            if (fx > L::bar_end_x)
                continue;

            GridlinePlacement g;
            g.value    = v;
            g.x        = cm.x(fx);
            g.y_top    = cm.y(L::chart_top);
            g.y_bottom = cm.y(L::chart_bottom);
            g.width    = line_w;
            g.color    = theme::gridline.with_alpha(0.5f);
            g.label    = text_at(format_grid_label(v),
                              g.x,
                              cm.y(L::chart_top + 0.02f),
                              FontRole::GridLabel,
                              theme::text_gray,
                              TextAlign::Center,
                              TextVAlign::Bottom);
            plan.gridlines.push_back(std::move(g));
        }
    }

    const size_t n_bars = config.series.size();
    if (n_bars > 0)
    {
        const float bar_h   = std::min(L::max_bar_h, chart_span / static_cast<float>(n_bars) * L::bar_fill);
        const float spacing = chart_span / static_cast<float>(n_bars);
        const float radius  = L::corner * static_cast<float>(std::min(config.width, config.height));

        plan.bars.reserve(n_bars);
        for (const auto& name : config.series)
        {
            const double value = frame.value(name);
            auto         it    = positions.find(name);
            const float  slot  = it != positions.end() ? it->second : 0.0f;

            const float y_center = cm.y(L::chart_top) + cm.h((slot + 0.5f) * spacing);

            float bar_w = L::min_bar_w;
            if (max_val > 0.0 && value > 0.0)
                bar_w = static_cast<float>(value / max_val) * bar_span;

            BarPlacement b;
            b.series        = name;
            b.value         = value;
            b.slot          = slot;
            b.bar           = Rect{cm.x(L::bar_start_x),
                                   y_center - cm.h(bar_h) / 2.0f,
                                   cm.w(std::max(bar_w, L::min_bar_w)),
                                   cm.h(bar_h)};
            b.corner_radius = radius;
            b.color         = theme::bar;

            // Thin light strip across the upper part of the bar
            b.highlighted = bar_w > L::highlight_w;
            if (b.highlighted)
            {
                b.highlight       = Rect{cm.x(L::bar_start_x),
                                         y_center - cm.h(bar_h * 0.40f),
                                         cm.w(bar_w),
                                         cm.h(bar_h * 0.15f)};
                b.highlight_color = colors::white.with_alpha(0.2f);
            }

            b.name    = text_at(display_name(name),
                             cm.x(L::name_end_x),
                             y_center,
                             FontRole::Name,
                             theme::text_white,
                             TextAlign::Right,
                             TextVAlign::Middle);
            b.percent = text_at(format_percent(value),
                                cm.x(L::bar_start_x + bar_w + L::percent_pad),
                                y_center,
                                FontRole::Percent,
                                theme::text_cyan,
                                TextAlign::Left,
                                TextVAlign::Middle);
            plan.bars.push_back(std::move(b));
        }
    }

    plan.headings.push_back(text_at(config.title,
                                    cm.x(0.5f),
                                    cm.y(L::title_y),
                                    FontRole::Title,
                                    theme::text_white,
                                    TextAlign::Center,
                                    TextVAlign::Middle));

    plan.footers.push_back(text_at(format_frame_date(frame.timestamp),
                                   cm.x(0.5f),
                                   cm.y(L::timestamp_y),
                                   FontRole::Timestamp,
                                   theme::text_gray,
                                   TextAlign::Center,
                                   TextVAlign::Middle));
    plan.footers.push_back(text_at(config.attribution,
                                   cm.x(0.5f),
                                   cm.y(L::attribution_y),
                                   FontRole::Attribution,
                                   theme::text_gray.with_alpha(0.7f),
                                   TextAlign::Center,
                                   TextVAlign::Middle));

    plan.logo.visible       = true;
    plan.logo.x             = cm.x(L::logo_pad);
    plan.logo.bottom        = cm.y(L::logo_pad);
    plan.logo.target_height = std::floor(cm.h(L::logo_height));

    return plan;
}

RenderPlan layout_placeholder(const RenderConfig& config, const std::string& message)
{
    RenderPlan plan;
    plan.width        = config.width;
    plan.height       = config.height;
    plan.background   = theme::background;
    plan.logo.visible = false;
    plan.headings.push_back(text_at(message,
                                    static_cast<float>(config.width) / 2.0f,
                                    static_cast<float>(config.height) / 2.0f,
                                    FontRole::Notice,
                                    colors::white,
                                    TextAlign::Center,
                                    TextVAlign::Middle));
    return plan;
}

}  // namespace barrace
