#include <gtest/gtest.h>

#include <barrace/bar_race.hpp>
#include <barrace/error.hpp>

#include <filesystem>
#include <stdexcept>

using namespace barrace;

namespace fs = std::filesystem;

namespace
{

SeriesTable race_table()
{
    SeriesTable table({"Alice", "Bob", "Carol"});
    table.add_row(1740787200.0, {0.10, 0.50, 0.40});
    table.add_row(1740873600.0, {0.20, 0.45, 0.35});
    table.add_row(1740960000.0, {0.40, 0.30, 0.30});
    table.add_row(1741046400.0, {0.60, 0.20, std::nullopt});
    return table;
}

ChartOptions short_race()
{
    ChartOptions opts;
    opts.title    = "Test race";
    opts.fps      = 10;
    opts.duration = 1.0;
    return opts;
}

bool is_png(const std::vector<uint8_t>& bytes)
{
    return bytes.size() > 8 && bytes[0] == 0x89 && bytes[1] == 'P' && bytes[2] == 'N' && bytes[3] == 'G';
}

}  // namespace

TEST(BarRace, FrameCountFromFpsAndDuration)
{
    BarRaceAnimator race(race_table(), short_race());
    EXPECT_TRUE(race.has_frames());
    EXPECT_EQ(race.frame_count(), 10u);
    EXPECT_EQ(race.frames().size(), 10u);
    EXPECT_EQ(race.positions().size(), 10u);
    EXPECT_EQ(race.default_preview_index(), 8u);
}

TEST(BarRace, DisplayListTruncatedToMaxCandidates)
{
    ChartOptions opts   = short_race();
    opts.max_candidates = 2;
    BarRaceAnimator race(race_table(), opts);

    ASSERT_EQ(race.display_series().size(), 2u);
    EXPECT_EQ(race.display_series()[0], "Alice");
    EXPECT_EQ(race.display_series()[1], "Bob");
    EXPECT_EQ(race.plan(0).bars.size(), 2u);
}

TEST(BarRace, HiddenSeriesStillScalesAxis)
{
    SeriesTable table({"A", "B", "C"});
    table.add_row(1740787200.0, {0.1, 0.05, 0.9});
    table.add_row(1740873600.0, {0.1, 0.05, 0.9});

    ChartOptions opts   = short_race();
    opts.max_candidates = 2;
    BarRaceAnimator race(table, opts);

    ASSERT_EQ(race.display_series().size(), 2u);
    EXPECT_EQ(race.frames()[0].values.count("C"), 1u);

    RenderPlan plan = race.plan(0);
    EXPECT_EQ(plan.bars.size(), 2u);
    EXPECT_NEAR(plan.max_value, 0.99, 1e-12);
    EXPECT_DOUBLE_EQ(plan.grid_step, 0.2);
    for (const auto& bar : plan.bars)
        EXPECT_NE(bar.series, "C");
}

TEST(BarRace, ExplicitDisplayOrder)
{
    ChartOptions opts = short_race();
    opts.series       = {"Carol", "Alice"};
    BarRaceAnimator race(race_table(), opts);

    ASSERT_EQ(race.display_series().size(), 2u);
    EXPECT_EQ(race.display_series()[0], "Carol");
    // Seeded from display order; Carol already leads in the first frame
    EXPECT_FLOAT_EQ(race.positions()[0].at("Carol"), 0.0f);
    EXPECT_FLOAT_EQ(race.positions()[0].at("Alice"), 1.0f);
}

TEST(BarRace, InvalidOptionsRejected)
{
    ChartOptions opts = short_race();
    opts.fps          = 0;
    EXPECT_THROW(BarRaceAnimator(race_table(), opts), InvalidConfigurationError);

    opts        = short_race();
    opts.series = {"Dave"};
    EXPECT_THROW(BarRaceAnimator(race_table(), opts), InvalidConfigurationError);
}

TEST(BarRace, RanksEaseTowardLeader)
{
    BarRaceAnimator race(race_table(), short_race());
    const auto&     first = race.positions().front();
    const auto&     last  = race.positions().back();

    // Alice is seeded on top, sinks while trailing, then climbs back once she leads
    EXPECT_GT(first.at("Alice"), 0.0f);
    EXPECT_LT(last.at("Alice"), race.positions()[4].at("Alice"));
    EXPECT_GT(last.at("Bob"), 0.0f);
}

TEST(BarRace, PlanTitleAndBounds)
{
    BarRaceAnimator race(race_table(), short_race());
    RenderPlan      plan = race.plan(9);
    ASSERT_FALSE(plan.headings.empty());
    EXPECT_EQ(plan.headings[0].text, "TEST RACE");
    EXPECT_EQ(plan.footers[0].text, "MARCH 04, 2025");
    EXPECT_THROW(race.plan(10), std::out_of_range);
}

TEST(BarRace, RenderFrameIsPure)
{
    BarRaceAnimator race(race_table(), short_race());
    PixelBuffer     later = race.render_frame(7);
    race.render_frame(2);
    EXPECT_EQ(race.render_frame(7).rgba, later.rgba);
    EXPECT_EQ(later.width, 1080u);
}

TEST(BarRace, PreviewIsDeterministicPng)
{
    BarRaceAnimator race(race_table(), short_race());
    auto            a = race.render_preview();
    auto            b = race.render_preview(8);
    EXPECT_TRUE(is_png(a));
    EXPECT_EQ(a, b);
}

TEST(BarRace, TooFewRowsGivesPlaceholder)
{
    SeriesTable table({"Alice"});
    table.add_row(0.0, {0.5});

    BarRaceAnimator race(table, short_race());
    EXPECT_FALSE(race.has_frames());
    EXPECT_EQ(race.frame_count(), 0u);
    EXPECT_TRUE(is_png(race.render_preview()));
    EXPECT_THROW(race.animate("/tmp/barrace_unused.mp4"), InsufficientDataError);
}

TEST(BarRace, CreatePreviewImage)
{
    auto a = create_preview_image(race_table(), short_race());
    auto b = create_preview_image(race_table(), short_race());
    EXPECT_TRUE(is_png(a));
    EXPECT_EQ(a, b);

    auto empty = create_preview_image(SeriesTable({"A"}), short_race());
    EXPECT_TRUE(is_png(empty));
}

TEST(BarRace, VideoToMissingDirectoryLeavesNothing)
{
    const std::string out = "/nonexistent_barrace_dir/race.mp4";
    EXPECT_THROW(create_bar_race_video(race_table(), short_race(), out), EncodingError);
    EXPECT_FALSE(fs::exists(out));
}
