#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace barrace
{

// Seconds since the Unix epoch, UTC. Fractional for interpolated frames.
using Timestamp = double;

// One long-format sample: the value of one series at one instant.
struct Observation
{
    Timestamp   timestamp = 0.0;
    std::string series;
    double      value = 0.0;
};

struct SeriesRow
{
    Timestamp                          timestamp = 0.0;
    std::vector<std::optional<double>> values;   // one per series, missing = nullopt
};

// Rectangular time x series table. Columns are uniquely named series, rows are
// samples that may carry missing cells.
class SeriesTable
{
   public:
    SeriesTable() = default;

    // Throws std::invalid_argument if a name repeats.
    explicit SeriesTable(std::vector<std::string> series);

    // Throws std::invalid_argument if values.size() != series_count().
    void add_row(Timestamp timestamp, std::vector<std::optional<double>> values);

    // Stable ascending sort on the row timestamps.
    void sort_by_time();

    // Forward fill then back fill every column. A column without any value
    // stays missing.
    void fill_gaps();

    // Long to wide format. Repeated (timestamp, series) pairs keep the last
    // value, columns come out in lexicographic order, rows sorted by time.
    // Cells with no sample stay missing; call fill_gaps() to close them.
    static SeriesTable pivot(const std::vector<Observation>& observations);

    size_t row_count() const { return rows_.size(); }
    size_t series_count() const { return series_.size(); }
    bool   empty() const { return rows_.empty(); }

    const std::vector<std::string>& series() const { return series_; }
    const std::vector<SeriesRow>&   rows() const { return rows_; }

    // Column index of a series, or nullopt if the table does not carry it.
    std::optional<size_t> index_of(const std::string& name) const;
    bool                  contains(const std::string& name) const { return index_of(name).has_value(); }

    Timestamp             timestamp(size_t row) const { return rows_.at(row).timestamp; }
    std::optional<double> value(size_t row, size_t column) const
    {
        return rows_.at(row).values.at(column);
    }

   private:
    std::vector<std::string> series_;
    std::vector<SeriesRow>   rows_;
};

}  // namespace barrace
