#pragma once

#include <barrace/chart_options.hpp>
#include <barrace/frame.hpp>
#include <barrace/render_plan.hpp>

#include <string>
#include <vector>

namespace barrace
{

// Canvas fractions of the chart area. Vertical values are measured from the
// bottom edge.
namespace chart_layout
{
inline constexpr float name_end_x    = 0.26f;
inline constexpr float bar_start_x   = 0.28f;
inline constexpr float bar_end_x     = 0.82f;
inline constexpr float chart_top     = 0.80f;
inline constexpr float chart_bottom  = 0.15f;
inline constexpr float max_bar_h     = 0.06f;
inline constexpr float bar_fill      = 0.8f;
inline constexpr float min_bar_w     = 0.01f;
inline constexpr float highlight_w   = 0.02f;
inline constexpr float percent_pad   = 0.02f;
inline constexpr float corner        = 0.008f;
inline constexpr float title_y       = 0.92f;
inline constexpr float timestamp_y   = 0.04f;
inline constexpr float attribution_y = 0.015f;
inline constexpr float logo_pad      = 0.04f;
inline constexpr float logo_height   = 0.12f;
inline constexpr double headroom     = 1.1;
inline constexpr int   name_chars    = 20;
}  // namespace chart_layout

// Axis maximum for a frame: largest positive value (0.1 when there is none)
// plus 10% headroom.
double axis_max(const Frame& frame);

// Gridline spacing for an axis maximum: 0.02, 0.05, 0.1 or 0.2.
double grid_step_for(double max_value);

// Gridline values k * step for k = 1, 2, ... up to max_value.
std::vector<double> gridline_values(double max_value, double step);

std::string format_percent(double value);        // "12.3%"
std::string format_grid_label(double value);     // "20%"
std::string format_frame_date(Timestamp ts);     // "MARCH 04, 2025"
std::string display_name(const std::string& series);

// Geometry and text for one frame. Pure: equal inputs give equal plans.
RenderPlan layout_frame(const Frame& frame, const Positions& positions, const RenderConfig& config);

// Plan for the "no data" placeholder image.
RenderPlan layout_placeholder(const RenderConfig& config, const std::string& message);

}  // namespace barrace
