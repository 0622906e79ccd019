#include <gtest/gtest.h>

#include <barrace/series_naming.hpp>

using namespace barrace;

TEST(SeriesNaming, YesSubTitleWins)
{
    MarketLabelFields f;
    f.yes_sub_title = "Sherrone Moore";
    f.subtitle      = "Other";
    f.title         = "Will Someone win?";
    f.ticker        = "KXMICHCOACH-25-SMOO";
    EXPECT_EQ(derive_series_name(f), "Sherrone Moore");
}

TEST(SeriesNaming, BlankFieldsAreSkipped)
{
    MarketLabelFields f;
    f.yes_sub_title = "   ";
    f.subtitle      = " Jim Harbaugh ";
    EXPECT_EQ(derive_series_name(f), "Jim Harbaugh");
}

TEST(SeriesNaming, NameFromWillWinTitle)
{
    MarketLabelFields f;
    f.title = "Will Jim Harbaugh win the award?";
    EXPECT_EQ(derive_series_name(f), "Jim Harbaugh");
}

TEST(SeriesNaming, NameFromWillBeTitle)
{
    MarketLabelFields f;
    f.title = "Who is next? will Dan Campbell be the coach?";
    EXPECT_EQ(derive_series_name(f), "Dan Campbell");
}

TEST(SeriesNaming, TickerSuffixUpperCased)
{
    MarketLabelFields f;
    f.title  = "Michigan head coach";
    f.ticker = "KXMICHCOACH-25-smoo";
    EXPECT_EQ(derive_series_name(f), "SMOO");
}

TEST(SeriesNaming, PlainTickerThenUnknown)
{
    MarketLabelFields f;
    f.ticker = "FEDHOLD";
    EXPECT_EQ(derive_series_name(f), "FEDHOLD");

    EXPECT_EQ(derive_series_name(MarketLabelFields{}), "Unknown");
}

TEST(SeriesNaming, KnownTitles)
{
    EXPECT_EQ(default_title("KXMICHCOACH"), "WHO WILL BE MICHIGAN'S NEXT HEAD COACH?");
    EXPECT_EQ(default_title("KXFEDRATE"), "WHAT WILL THE FED DO WITH INTEREST RATES?");
}

TEST(SeriesNaming, GeneratedTitle)
{
    EXPECT_EQ(default_title("KXNBA_FINALS"), "NBA FINALS MARKET");
    EXPECT_EQ(default_title("oscars"), "OSCARS MARKET");
}
