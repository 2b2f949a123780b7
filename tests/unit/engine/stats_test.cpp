/// @file stats_test.cpp
/// @brief Tests for numeric and cell helpers

#include "engine/stats.h"

#include <cmath>

#include <gtest/gtest.h>

namespace wcopt::engine {
namespace {

TEST(StatsTest, RoundsHalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(Round(2.5), 3.0);
    EXPECT_DOUBLE_EQ(Round(-2.5), -3.0);
    EXPECT_DOUBLE_EQ(Round(48.75, 1), 48.8);
    EXPECT_DOUBLE_EQ(Round(16.6666, 2), 16.67);
}

TEST(StatsTest, MeanOfEmptySeriesIsZero) {
    EXPECT_DOUBLE_EQ(Mean({}), 0.0);
    EXPECT_DOUBLE_EQ(Mean({1, 2, 3, 4}), 2.5);
}

TEST(StatsTest, StandardDeviations) {
    const std::vector<double> values = {2, 4, 4, 4, 5, 5, 7, 9};
    EXPECT_DOUBLE_EQ(PopulationStdDev(values), 2.0);
    EXPECT_DOUBLE_EQ(SampleStdDev(values), std::sqrt(32.0 / 7.0));
}

TEST(StatsTest, SampleStdDevNeedsTwoValues) {
    EXPECT_DOUBLE_EQ(SampleStdDev({}), 0.0);
    EXPECT_DOUBLE_EQ(SampleStdDev({42}), 0.0);
    EXPECT_DOUBLE_EQ(PopulationStdDev({}), 0.0);
}

TEST(StatsTest, PercentOfNonPositiveTotalIsZero) {
    EXPECT_DOUBLE_EQ(Percent(25, 200), 12.5);
    EXPECT_DOUBLE_EQ(Percent(25, 0), 0.0);
    EXPECT_DOUBLE_EQ(Percent(25, -10), 0.0);
}

TEST(StatsTest, CellNumber) {
    EXPECT_EQ(CellNumber(storage::Cell("12.5")), 12.5);
    EXPECT_EQ(CellNumber(storage::Cell(" 7 ")), 7.0);
    EXPECT_FALSE(CellNumber(storage::Cell("n/a")).has_value());
    EXPECT_FALSE(CellNumber(storage::Cell()).has_value());
}

TEST(StatsTest, CellTextTreatsBlankAsMissing) {
    EXPECT_EQ(CellText(storage::Cell("Acme")), "Acme");
    EXPECT_FALSE(CellText(storage::Cell("   ")).has_value());
    EXPECT_FALSE(CellText(storage::Cell()).has_value());
}

TEST(StatsTest, CellDayReadsDatePrefix) {
    EXPECT_EQ(CellDay(storage::Cell("2024-03-15T10:00:00")), absl::CivilDay(2024, 3, 15));
    EXPECT_EQ(CellDay(storage::Cell("2024-03-15")), absl::CivilDay(2024, 3, 15));
    EXPECT_FALSE(CellDay(storage::Cell("15/03/2024")).has_value());
    EXPECT_FALSE(CellDay(storage::Cell("2024")).has_value());
    EXPECT_FALSE(CellDay(storage::Cell()).has_value());
}

TEST(StatsTest, CellFlag) {
    for (const char* yes : {"true", "TRUE", "1", "yes", "Y", "1.0"}) {
        EXPECT_TRUE(CellFlag(storage::Cell(yes))) << yes;
    }
    for (const char* no : {"false", "0", "no", ""}) {
        EXPECT_FALSE(CellFlag(storage::Cell(no))) << no;
    }
    EXPECT_FALSE(CellFlag(storage::Cell()));
}

TEST(StatsTest, FormatDayPadsFields) {
    EXPECT_EQ(FormatDay(absl::CivilDay(2024, 3, 5)), "2024-03-05");
}

}  // namespace
}  // namespace wcopt::engine
