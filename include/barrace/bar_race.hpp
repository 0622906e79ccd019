#pragma once

#include <barrace/chart_options.hpp>
#include <barrace/frame.hpp>
#include <barrace/render_plan.hpp>
#include <barrace/renderer.hpp>
#include <barrace/series_table.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace barrace
{

// One bar race render: resamples the table, runs the rank easing pass and
// renders frames on demand.
//
// Construction validates options (InvalidConfigurationError). A table with
// fewer than two rows, or nothing left to display, yields no frames;
// has_frames() reports it and animate() throws InsufficientDataError.
class BarRaceAnimator
{
   public:
    BarRaceAnimator(const SeriesTable& table, ChartOptions options, RenderAssets assets = {});

    uint32_t frame_count() const { return frame_count_; }
    bool     has_frames() const { return !frames_.empty(); }

    const ChartOptions&             options() const { return options_; }
    const RenderConfig&             render_config() const { return config_; }
    const std::vector<std::string>& display_series() const { return config_.series; }
    const std::vector<Frame>&       frames() const { return frames_; }
    const std::vector<Positions>&   positions() const { return positions_; }

    // Throws std::out_of_range for an index past the last frame.
    RenderPlan  plan(uint32_t frame_index) const;
    PixelBuffer render_frame(uint32_t frame_index) const;

    uint32_t default_preview_index() const;

    // Encode every frame to output_path; returns the path written.
    std::string animate(const std::string& output_path) const;

    // PNG of one frame (default: 80% through). Without frames this is a
    // "No data available" placeholder.
    std::vector<uint8_t> render_preview(std::optional<uint32_t> frame_index = std::nullopt) const;

   private:
    ChartOptions           options_;
    RenderConfig           config_;
    FrameRenderer          renderer_;
    uint32_t               frame_count_ = 0;
    std::vector<Frame>     frames_;
    std::vector<Positions> positions_;
};

// Encode a bar race video; returns the output path.
std::string create_bar_race_video(const SeriesTable&  table,
                                  const ChartOptions& options,
                                  const std::string&  output_path,
                                  RenderAssets        assets = {});

// PNG preview at frame_position of a 30 fps, 8 s race.
std::vector<uint8_t> create_preview_image(const SeriesTable&  table,
                                          const ChartOptions& options,
                                          double              frame_position = 0.8,
                                          RenderAssets        assets         = {});

}  // namespace barrace
