#include <barrace/error.hpp>
#include <barrace/logger.hpp>
#include <barrace/resampler.hpp>

#include <algorithm>
#include <cmath>

namespace barrace
{

std::vector<double> frame_row_indices(size_t row_count, uint32_t frame_count)
{
    std::vector<double> indices;
    if (row_count == 0 || frame_count == 0)
        return indices;

    indices.resize(frame_count);
    if (frame_count == 1)
    {
        indices[0] = 0.0;
        return indices;
    }

    double last = static_cast<double>(row_count - 1);
    double step = last / static_cast<double>(frame_count - 1);
    for (uint32_t i = 0; i < frame_count; ++i)
        indices[i] = static_cast<double>(i) * step;
    // Pin the endpoint so the final frame lands exactly on the last row
    indices.back() = last;
    return indices;
}

std::vector<Frame> resample(const SeriesTable&              table,
                            uint32_t                        frame_count,
                            const std::vector<std::string>& series)
{
    if (table.row_count() < 2 || frame_count == 0)
    {
        BARRACE_LOG_DEBUG("anim",
                          "Nothing to resample ({} rows, {} frames requested)",
                          table.row_count(),
                          frame_count);
        return {};
    }

    const std::vector<std::string>& names = series.empty() ? table.series() : series;

    std::vector<size_t> columns;
    columns.reserve(names.size());
    for (const auto& name : names)
    {
        auto column = table.index_of(name);
        if (!column)
            throw InvalidConfigurationError("Series not present in table: " + name);
        columns.push_back(*column);
    }

    const size_t n_rows = table.row_count();
    auto         cell   = [&](size_t row, size_t column)
    {
        // Missing cells interpolate as zero
        return table.value(row, column).value_or(0.0);
    };

    std::vector<Frame> frames;
    frames.reserve(frame_count);
    for (double idx : frame_row_indices(n_rows, frame_count))
    {
        auto   lower = static_cast<size_t>(std::floor(idx));
        size_t upper = std::min(static_cast<size_t>(std::ceil(idx)), n_rows - 1);
        double t     = idx - static_cast<double>(lower);

        Frame frame;
        frame.values.reserve(names.size());
        for (size_t i = 0; i < names.size(); ++i)
        {
            double lv = cell(lower, columns[i]);
            double uv = cell(upper, columns[i]);
            frame.values.emplace(names[i], lv + (uv - lv) * t);
        }

        Timestamp lower_ts = table.timestamp(lower);
        Timestamp upper_ts = table.timestamp(upper);
        frame.timestamp    = lower == upper ? lower_ts : lower_ts + (upper_ts - lower_ts) * t;

        frames.push_back(std::move(frame));
    }

    BARRACE_LOG_DEBUG("anim",
                      "Resampled {} rows x {} series into {} frames",
                      n_rows,
                      names.size(),
                      frames.size());
    return frames;
}

}  // namespace barrace
