#pragma once

#include <barrace/series_table.hpp>

#include <string>
#include <unordered_map>

namespace barrace
{

// One output instant: an interpolated timestamp and a defined value for every
// requested series.
struct Frame
{
    Timestamp                               timestamp = 0.0;
    std::unordered_map<std::string, double> values;

    // 0.0 for a series the frame does not carry.
    double value(const std::string& series) const
    {
        auto it = values.find(series);
        return it != values.end() ? it->second : 0.0;
    }
};

// Fractional vertical slot per series; 0 is the top row.
using Positions = std::unordered_map<std::string, float>;

}  // namespace barrace
