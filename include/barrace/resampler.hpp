#pragma once

#include <barrace/frame.hpp>
#include <barrace/series_table.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace barrace
{

// Resample an irregular table onto frame_count evenly spaced frames by linear
// interpolation between the two bracketing rows. Missing cells count as 0.0.
//
// series selects the columns to carry (empty = every table column); naming a
// series the table lacks throws InvalidConfigurationError.
//
// Returns an empty vector when the table has fewer than two rows or
// frame_count is zero.
std::vector<Frame> resample(const SeriesTable&              table,
                            uint32_t                        frame_count,
                            const std::vector<std::string>& series = {});

// Evenly spaced fractional row indices over [0, row_count - 1], endpoints
// included.
std::vector<double> frame_row_indices(size_t row_count, uint32_t frame_count);

}  // namespace barrace
