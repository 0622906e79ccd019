#pragma once

#include <barrace/series_table.hpp>

#include <optional>
#include <string>

namespace barrace
{

// Load a series table from CSV/TSV.
//
// Wide layout: first column timestamps, one column per series, empty cell =
// missing. Long layout (header exactly timestamp,series,value): pivoted and
// gap-filled. Throws std::runtime_error on unreadable or malformed input.
SeriesTable load_series_csv(const std::string& path);

// Epoch seconds, "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS]" or the same with 'T',
// read as UTC.
std::optional<Timestamp> parse_timestamp(const std::string& text);

}  // namespace barrace
