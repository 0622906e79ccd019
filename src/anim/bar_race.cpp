#include <barrace/bar_race.hpp>
#include <barrace/error.hpp>
#include <barrace/export.hpp>
#include <barrace/layout.hpp>
#include <barrace/logger.hpp>
#include <barrace/rank_smoother.hpp>
#include <barrace/resampler.hpp>

#include <stdexcept>
#include <utility>

namespace barrace
{

namespace
{

std::vector<std::string> select_series(const SeriesTable& table, const ChartOptions& options)
{
    std::vector<std::string> series = options.series.empty() ? table.series() : options.series;
    for (const auto& name : series)
    {
        if (!table.contains(name))
            throw InvalidConfigurationError("Series not present in table: " + name);
    }
    if (series.size() > static_cast<size_t>(options.max_candidates))
        series.resize(static_cast<size_t>(options.max_candidates));
    return series;
}

}  // namespace

BarRaceAnimator::BarRaceAnimator(const SeriesTable& table, ChartOptions options, RenderAssets assets)
    : options_(std::move(options)), renderer_(std::move(assets))
{
    validate_options(options_);
    config_ = make_render_config(options_, select_series(table, options_));

    if (table.row_count() < 2 || config_.series.empty())
    {
        BARRACE_LOG_WARN("anim",
                         "Not enough data to animate ({} rows, {} series)",
                         table.row_count(),
                         config_.series.size());
        return;
    }

    // Every column is carried so hidden series still scale the axis
    frames_      = resample(table, frame_count_for(options_.fps, options_.duration));
    positions_   = ease_positions(frames_, config_.series);
    frame_count_ = static_cast<uint32_t>(frames_.size());

    BARRACE_LOG_INFO("anim",
                     "Bar race: {} series, {} rows -> {} frames ({} fps, {}s)",
                     config_.series.size(),
                     table.row_count(),
                     frame_count_,
                     options_.fps,
                     options_.duration);
}

RenderPlan BarRaceAnimator::plan(uint32_t frame_index) const
{
    if (frame_index >= frames_.size())
    {
        throw std::out_of_range("Frame " + std::to_string(frame_index) + " out of range (have "
                                + std::to_string(frames_.size()) + ")");
    }
    return layout_frame(frames_[frame_index], positions_[frame_index], config_);
}

PixelBuffer BarRaceAnimator::render_frame(uint32_t frame_index) const
{
    return renderer_.render(plan(frame_index));
}

uint32_t BarRaceAnimator::default_preview_index() const
{
    return default_preview_frame(frame_count_);
}

std::string BarRaceAnimator::animate(const std::string& output_path) const
{
    if (!has_frames())
        throw InsufficientDataError("Need at least two rows and one series to animate");

    FormatSpec  spec = format_spec(options_.format);
    VideoConfig video;
    video.output_path = output_path;
    video.width       = spec.width;
    video.height      = spec.height;
    video.fps         = options_.fps;

    return encode_video(video, frame_count_, [this](uint32_t i) { return render_frame(i); });
}

std::vector<uint8_t> BarRaceAnimator::render_preview(std::optional<uint32_t> frame_index) const
{
    if (!has_frames())
    {
        BARRACE_LOG_INFO("anim", "No frames, rendering placeholder preview");
        RenderPlan placeholder = layout_placeholder(config_, "No data available");
        return snapshot([&](uint32_t) { return renderer_.render(placeholder); }, 0);
    }

    uint32_t index = frame_index.value_or(default_preview_index());
    return snapshot([this](uint32_t i) { return render_frame(i); }, index);
}

std::string create_bar_race_video(const SeriesTable&  table,
                                  const ChartOptions& options,
                                  const std::string&  output_path,
                                  RenderAssets        assets)
{
    BarRaceAnimator animator(table, options, std::move(assets));
    return animator.animate(output_path);
}

std::vector<uint8_t> create_preview_image(const SeriesTable&  table,
                                          const ChartOptions& options,
                                          double              frame_position,
                                          RenderAssets        assets)
{
    // Previews always sample a standard 30 fps, 8 second race
    ChartOptions preview = options;
    preview.fps          = 30;
    preview.duration     = 8.0;

    BarRaceAnimator animator(table, preview, std::move(assets));
    if (!animator.has_frames())
        return animator.render_preview();
    return animator.render_preview(default_preview_frame(animator.frame_count(), frame_position));
}

}  // namespace barrace
