#include <barrace/series_table.hpp>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_set>

namespace barrace
{

SeriesTable::SeriesTable(std::vector<std::string> series) : series_(std::move(series))
{
    std::unordered_set<std::string> seen;
    for (const auto& name : series_)
    {
        if (!seen.insert(name).second)
            throw std::invalid_argument("Duplicate series name: " + name);
    }
}

void SeriesTable::add_row(Timestamp timestamp, std::vector<std::optional<double>> values)
{
    if (values.size() != series_.size())
    {
        throw std::invalid_argument("Row has " + std::to_string(values.size())
                                    + " values, table has " + std::to_string(series_.size())
                                    + " series");
    }
    rows_.push_back(SeriesRow{timestamp, std::move(values)});
}

void SeriesTable::sort_by_time()
{
    std::stable_sort(rows_.begin(),
                     rows_.end(),
                     [](const SeriesRow& a, const SeriesRow& b) { return a.timestamp < b.timestamp; });
}

void SeriesTable::fill_gaps()
{
    for (size_t c = 0; c < series_.size(); ++c)
    {
        // Forward pass
        std::optional<double> last;
        for (auto& row : rows_)
        {
            if (row.values[c].has_value())
                last = row.values[c];
            else if (last.has_value())
                row.values[c] = last;
        }

        // Backward pass covers the leading gap
        std::optional<double> next;
        for (auto it = rows_.rbegin(); it != rows_.rend(); ++it)
        {
            if (it->values[c].has_value())
                next = it->values[c];
            else if (next.has_value())
                it->values[c] = next;
        }
    }
}

SeriesTable SeriesTable::pivot(const std::vector<Observation>& observations)
{
    // timestamp -> series -> value; later observations overwrite earlier ones
    std::map<Timestamp, std::map<std::string, double>> cells;
    std::map<std::string, size_t>                      columns;
    for (const auto& obs : observations)
    {
        cells[obs.timestamp][obs.series] = obs.value;
        columns.emplace(obs.series, 0);
    }

    std::vector<std::string> names;
    names.reserve(columns.size());
    for (auto& [name, index] : columns)
    {
        index = names.size();
        names.push_back(name);
    }

    SeriesTable table(names);
    table.rows_.reserve(cells.size());
    for (const auto& [ts, row_cells] : cells)
    {
        std::vector<std::optional<double>> values(names.size());
        for (const auto& [name, value] : row_cells)
            values[columns.at(name)] = value;
        table.rows_.push_back(SeriesRow{ts, std::move(values)});
    }
    return table;
}

std::optional<size_t> SeriesTable::index_of(const std::string& name) const
{
    auto it = std::find(series_.begin(), series_.end(), name);
    if (it == series_.end())
        return std::nullopt;
    return static_cast<size_t>(std::distance(series_.begin(), it));
}

}  // namespace barrace
