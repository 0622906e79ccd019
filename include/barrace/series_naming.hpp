#pragma once

#include <optional>
#include <string>

namespace barrace
{

// Label fields a prediction market may carry, any of which may be absent.
struct MarketLabelFields
{
    std::optional<std::string> yes_sub_title;
    std::optional<std::string> subtitle;
    std::optional<std::string> title;
    std::optional<std::string> ticker;
};

// Display name for a market, first match wins:
//   1. yes_sub_title
//   2. subtitle
//   3. X from a title of the form "Will X win?" / "will X be ..."
//   4. ticker suffix after the last '-', upper-cased
//   5. ticker
//   6. "Unknown"
// Blank fields are skipped.
std::string derive_series_name(const MarketLabelFields& fields);

// Chart title for a series ticker: a fixed title for known tickers, otherwise
// the cleaned ticker followed by " MARKET".
std::string default_title(const std::string& series_ticker);

}  // namespace barrace
