#include <barrace/series_naming.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace barrace
{

namespace
{

std::string trim(const std::string& s)
{
    size_t begin = 0;
    size_t end   = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(begin, end - begin);
}

std::string to_upper(std::string s)
{
    std::transform(s.begin(),
                   s.end(),
                   s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string before_first(const std::string& s, std::string_view sep)
{
    auto pos = s.find(sep);
    return pos == std::string::npos ? s : s.substr(0, pos);
}

std::string after_last(const std::string& s, std::string_view sep)
{
    auto pos = s.rfind(sep);
    return pos == std::string::npos ? s : s.substr(pos + sep.size());
}

std::optional<std::string> non_blank(const std::optional<std::string>& field)
{
    if (!field)
        return std::nullopt;
    std::string t = trim(*field);
    if (t.empty())
        return std::nullopt;
    return t;
}

// "Will Jim Harbaugh win the ...?" -> "Jim Harbaugh"
std::optional<std::string> name_from_title(const std::string& title)
{
    for (std::string_view pattern : {std::string_view("Will "), std::string_view("will ")})
    {
        if (title.find(pattern) == std::string::npos)
            continue;
        std::string name = after_last(title, pattern);
        name             = before_first(name, "?");
        name             = before_first(name, " win");
        name             = before_first(name, " be ");
        name             = trim(name);
        if (name.empty())
            return std::nullopt;
        return name;
    }
    return std::nullopt;
}

constexpr std::array<std::pair<std::string_view, std::string_view>, 5> kKnownTitles = {{
    {"KXMICHCOACH", "WHO WILL BE MICHIGAN'S NEXT HEAD COACH?"},
    {"KXPRESWIN", "WHO WILL WIN THE 2024 PRESIDENTIAL ELECTION?"},
    {"KXFEDRATE", "WHAT WILL THE FED DO WITH INTEREST RATES?"},
    {"KXSUPERBOWL", "WHO WILL WIN THE SUPER BOWL?"},
    {"KXNFLMVP", "WHO WILL WIN NFL MVP?"},
}};

}  // namespace

std::string derive_series_name(const MarketLabelFields& fields)
{
    if (auto name = non_blank(fields.yes_sub_title))
        return *name;
    if (auto name = non_blank(fields.subtitle))
        return *name;
    if (fields.title)
    {
        if (auto name = name_from_title(*fields.title))
            return *name;
    }

    std::string ticker = fields.ticker.value_or("");
    if (ticker.find('-') != std::string::npos)
        return to_upper(after_last(ticker, "-"));
    if (!ticker.empty())
        return ticker;
    return "Unknown";
}

std::string default_title(const std::string& series_ticker)
{
    for (const auto& [ticker, title] : kKnownTitles)
    {
        if (series_ticker == ticker)
            return std::string(title);
    }

    std::string cleaned;
    cleaned.reserve(series_ticker.size());
    for (size_t i = 0; i < series_ticker.size(); ++i)
    {
        if (series_ticker.compare(i, 2, "KX") == 0)
        {
            ++i;
            continue;
        }
        cleaned += series_ticker[i] == '_' ? ' ' : series_ticker[i];
    }
    return to_upper(cleaned) + " MARKET";
}

}  // namespace barrace
