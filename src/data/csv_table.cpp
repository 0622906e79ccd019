#include <barrace/csv_table.hpp>
#include <barrace/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace barrace
{

namespace
{

// Detect delimiter by scanning the header line.
char detect_delimiter(const std::string& line)
{
    int commas = 0, semicolons = 0, tabs = 0;
    for (char c : line)
    {
        if (c == ',')
            ++commas;
        else if (c == ';')
            ++semicolons;
        else if (c == '\t')
            ++tabs;
    }
    if (tabs > 0 && tabs >= commas && tabs >= semicolons)
        return '\t';
    if (semicolons > commas)
        return ';';
    return ',';
}

void trim(std::string& s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Parse a finite double; the whole field must be consumed.
bool try_parse_double(const std::string& s, double& out)
{
    if (s.empty())
        return false;
    char*  end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    while (end && *end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (end == s.c_str() || (end && *end != '\0'))
        return false;
    if (!std::isfinite(val))
        return false;
    out = val;
    return true;
}

// Split a line by delimiter, respecting quoted fields.
std::vector<std::string> split_line(const std::string& line, char delim)
{
    std::vector<std::string> fields;
    std::string              field;
    bool                     in_quotes = false;

    for (char c : line)
    {
        if (c == '"')
        {
            in_quotes = !in_quotes;
        }
        else if (c == delim && !in_quotes)
        {
            trim(field);
            fields.push_back(field);
            field.clear();
        }
        else
        {
            field += c;
        }
    }
    trim(field);
    fields.push_back(field);

    return fields;
}

[[noreturn]] void fail(const std::string& path, size_t line_no, const std::string& what)
{
    throw std::runtime_error(path + ":" + std::to_string(line_no) + ": " + what);
}

struct Line
{
    size_t      number;
    std::string text;
};

bool is_long_header(const std::vector<std::string>& header)
{
    return header.size() == 3 && to_lower(header[0]) == "timestamp" && to_lower(header[1]) == "series"
           && to_lower(header[2]) == "value";
}

SeriesTable load_long(const std::string& path, const std::vector<Line>& lines, char delim)
{
    std::vector<Observation> observations;
    observations.reserve(lines.size());

    for (size_t i = 1; i < lines.size(); ++i)
    {
        auto fields = split_line(lines[i].text, delim);
        if (fields.size() != 3)
            fail(path, lines[i].number, "expected 3 fields, got " + std::to_string(fields.size()));

        auto ts = parse_timestamp(fields[0]);
        if (!ts)
            fail(path, lines[i].number, "bad timestamp '" + fields[0] + "'");
        if (fields[1].empty())
            fail(path, lines[i].number, "empty series name");

        double value = 0.0;
        if (!try_parse_double(fields[2], value))
            fail(path, lines[i].number, "bad value '" + fields[2] + "'");

        observations.push_back(Observation{*ts, fields[1], value});
    }

    SeriesTable table = SeriesTable::pivot(observations);
    table.fill_gaps();
    return table;
}

SeriesTable load_wide(const std::string&              path,
                      const std::vector<Line>&        lines,
                      char                            delim,
                      const std::vector<std::string>& header)
{
    if (header.size() < 2)
        fail(path, lines[0].number, "need a timestamp column and at least one series column");

    std::vector<std::string> series(header.begin() + 1, header.end());
    for (const auto& name : series)
    {
        if (name.empty())
            fail(path, lines[0].number, "empty series name in header");
    }

    SeriesTable table = [&]
    {
        try
        {
            return SeriesTable(series);
        }
        catch (const std::invalid_argument& e)
        {
            fail(path, lines[0].number, e.what());
        }
    }();

    for (size_t i = 1; i < lines.size(); ++i)
    {
        auto fields = split_line(lines[i].text, delim);
        if (fields.size() > header.size())
            fail(path, lines[i].number, "too many fields");

        auto ts = parse_timestamp(fields[0]);
        if (!ts)
            fail(path, lines[i].number, "bad timestamp '" + fields[0] + "'");

        std::vector<std::optional<double>> values(series.size());
        for (size_t c = 1; c < fields.size(); ++c)
        {
            if (fields[c].empty())
                continue;
            double value = 0.0;
            if (!try_parse_double(fields[c], value))
                fail(path, lines[i].number, "bad value '" + fields[c] + "'");
            values[c - 1] = value;
        }
        table.add_row(*ts, std::move(values));
    }

    table.sort_by_time();
    return table;
}

}  // namespace

std::optional<Timestamp> parse_timestamp(const std::string& text)
{
    std::string s = text;
    trim(s);
    if (s.empty())
        return std::nullopt;

    double epoch = 0.0;
    if (try_parse_double(s, epoch))
        return epoch;

    if (s.back() == 'Z')
        s.pop_back();

    int  year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep      = 0;
    int  consumed = 0;

    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3)
        return std::nullopt;

    if (static_cast<size_t>(consumed) != s.size())
    {
        int rest = 0;
        if (std::sscanf(s.c_str() + consumed, "%c%2d:%2d%n", &sep, &hour, &minute, &rest) != 3)
            return std::nullopt;
        if (sep != ' ' && sep != 'T')
            return std::nullopt;
        consumed += rest;
        if (static_cast<size_t>(consumed) != s.size())
        {
            rest = 0;
            if (std::sscanf(s.c_str() + consumed, ":%2d%n", &second, &rest) != 1)
                return std::nullopt;
            consumed += rest;
            if (static_cast<size_t>(consumed) != s.size())
                return std::nullopt;
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0
        || minute > 59 || second < 0 || second > 60)
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon  = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = minute;
    tm.tm_sec  = second;
    return static_cast<Timestamp>(timegm(&tm));
}

SeriesTable load_series_csv(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open file: " + path);

    std::vector<Line> lines;
    std::string       line;
    size_t            number = 0;
    while (std::getline(file, line))
    {
        ++number;
        // Strip trailing \r (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            lines.push_back(Line{number, line});
    }

    if (lines.empty())
        throw std::runtime_error(path + ": file is empty");

    char delim  = detect_delimiter(lines[0].text);
    auto header = split_line(lines[0].text, delim);

    SeriesTable table = is_long_header(header) ? load_long(path, lines, delim)
                                               : load_wide(path, lines, delim, header);

    BARRACE_LOG_INFO("data",
                     "Loaded {}: {} rows x {} series",
                     path,
                     table.row_count(),
                     table.series_count());
    return table;
}

}  // namespace barrace
