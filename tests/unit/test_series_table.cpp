#include <gtest/gtest.h>

#include <barrace/series_table.hpp>

#include <stdexcept>

using namespace barrace;

TEST(SeriesTable, RejectsDuplicateSeries)
{
    EXPECT_THROW(SeriesTable({"A", "B", "A"}), std::invalid_argument);
}

TEST(SeriesTable, RejectsRowOfWrongWidth)
{
    SeriesTable table({"A", "B"});
    EXPECT_THROW(table.add_row(0.0, {1.0}), std::invalid_argument);
    EXPECT_TRUE(table.empty());
}

TEST(SeriesTable, IndexOfAndContains)
{
    SeriesTable table({"Alpha", "Beta"});
    ASSERT_TRUE(table.index_of("Beta").has_value());
    EXPECT_EQ(*table.index_of("Beta"), 1u);
    EXPECT_FALSE(table.index_of("Gamma").has_value());
    EXPECT_TRUE(table.contains("Alpha"));
    EXPECT_FALSE(table.contains("alpha"));
}

TEST(SeriesTable, SortByTimeIsStable)
{
    SeriesTable table({"A"});
    table.add_row(30.0, {3.0});
    table.add_row(10.0, {1.0});
    table.add_row(10.0, {2.0});
    table.sort_by_time();

    ASSERT_EQ(table.row_count(), 3u);
    EXPECT_DOUBLE_EQ(table.timestamp(0), 10.0);
    EXPECT_DOUBLE_EQ(*table.value(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(*table.value(1, 0), 2.0);
    EXPECT_DOUBLE_EQ(table.timestamp(2), 30.0);
}

TEST(SeriesTable, FillGapsForwardThenBackward)
{
    SeriesTable table({"A", "B", "C"});
    table.add_row(0.0, {std::nullopt, 0.5, std::nullopt});
    table.add_row(1.0, {0.2, std::nullopt, std::nullopt});
    table.add_row(2.0, {std::nullopt, 0.7, std::nullopt});
    table.fill_gaps();

    // Leading gap closed from the first known value
    EXPECT_DOUBLE_EQ(*table.value(0, 0), 0.2);
    EXPECT_DOUBLE_EQ(*table.value(2, 0), 0.2);
    EXPECT_DOUBLE_EQ(*table.value(1, 1), 0.5);
    EXPECT_DOUBLE_EQ(*table.value(2, 1), 0.7);
    // A column without any value stays missing
    EXPECT_FALSE(table.value(0, 2).has_value());
    EXPECT_FALSE(table.value(2, 2).has_value());
}

TEST(SeriesTable, PivotOrdersColumnsAndKeepsLastValue)
{
    std::vector<Observation> obs = {
        {20.0, "Zed", 0.1},
        {10.0, "Amy", 0.4},
        {10.0, "Zed", 0.3},
        {20.0, "Amy", 0.5},
        {20.0, "Amy", 0.6},
    };
    SeriesTable table = SeriesTable::pivot(obs);

    ASSERT_EQ(table.series_count(), 2u);
    EXPECT_EQ(table.series()[0], "Amy");
    EXPECT_EQ(table.series()[1], "Zed");

    ASSERT_EQ(table.row_count(), 2u);
    EXPECT_DOUBLE_EQ(table.timestamp(0), 10.0);
    EXPECT_DOUBLE_EQ(*table.value(0, 0), 0.4);
    EXPECT_DOUBLE_EQ(*table.value(0, 1), 0.3);
    EXPECT_DOUBLE_EQ(*table.value(1, 0), 0.6);
    EXPECT_DOUBLE_EQ(*table.value(1, 1), 0.1);
}

TEST(SeriesTable, PivotLeavesUnsampledCellsMissing)
{
    std::vector<Observation> obs = {
        {10.0, "A", 0.4},
        {20.0, "B", 0.3},
    };
    SeriesTable table = SeriesTable::pivot(obs);

    ASSERT_EQ(table.row_count(), 2u);
    EXPECT_FALSE(table.value(0, 1).has_value());
    EXPECT_FALSE(table.value(1, 0).has_value());

    table.fill_gaps();
    EXPECT_DOUBLE_EQ(*table.value(0, 1), 0.3);
    EXPECT_DOUBLE_EQ(*table.value(1, 0), 0.4);
}
