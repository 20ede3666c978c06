#include "analysis/DreamStatistics.hpp"
#include <gtest/gtest.h>

#include "TestJournal.hpp"

using namespace LucidLog;
using Testing::day;
using Testing::dream;
using Testing::lucidDream;

TEST(DreamStatistics, LucidPercentageScenario) {
    const std::vector<core::DreamRecord> dreams = {
        dream(1, "2024-01-01 06:00", "a"),
        lucidDream(2, "2024-01-01 06:30", "b"),
        dream(3, "2024-01-01 07:00", "c"),
        dream(4, "2024-01-02 07:00", "d"),
    };

    const auto stats = Analysis::DreamStatisticsCalculator{}.compute(dreams);
    EXPECT_EQ(stats.totalDreams, 4u);
    EXPECT_EQ(stats.lucidDreams, 1u);
    EXPECT_DOUBLE_EQ(stats.lucidPercentage, 25.0);
}

TEST(DreamStatistics, PercentageBounds) {
    EXPECT_DOUBLE_EQ(Analysis::DreamStatisticsCalculator::lucidPercentage(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(Analysis::DreamStatisticsCalculator::lucidPercentage(3, 3), 100.0);

    const auto empty = Analysis::DreamStatisticsCalculator{}.compute({});
    EXPECT_EQ(empty.totalDreams, 0u);
    EXPECT_DOUBLE_EQ(empty.lucidPercentage, 0.0);
    EXPECT_FALSE(empty.averageWordCount.has_value());
    EXPECT_TRUE(empty.dreamsByDay.empty());
    EXPECT_TRUE(empty.commonDreamSigns.empty());
}

TEST(DreamStatistics, GroupsByDayWeekAndMonth) {
    const std::vector<core::DreamRecord> dreams = {
        dream(1, "2024-12-30 06:00", "one two"),
        dream(2, "2024-12-31 06:00", "three four"),
        dream(3, "2025-01-01 06:00", "five six seven eight"),
    };

    const auto stats = Analysis::DreamStatisticsCalculator{}.compute(dreams);
    EXPECT_EQ(stats.dreamsByDay.size(), 3u);

    // All three days fall in ISO week 2025-W01.
    ASSERT_EQ(stats.dreamsByWeek.size(), 1u);
    EXPECT_EQ(stats.dreamsByWeek.begin()->first, (core::IsoWeek{2025, 1}));
    EXPECT_EQ(stats.dreamsByWeek.begin()->second, 3u);

    ASSERT_EQ(stats.dreamsByMonth.size(), 2u);
    EXPECT_EQ(stats.dreamsByMonth.at(core::YearMonth{2024, 12}), 2u);
    EXPECT_EQ(stats.dreamsByMonth.at(core::YearMonth{2025, 1}), 1u);

    ASSERT_TRUE(stats.averageWordCount.has_value());
    EXPECT_DOUBLE_EQ(*stats.averageWordCount, 8.0 / 3.0);
}

TEST(DreamStatistics, DreamSignsRankedOverLucidDreams) {
    const std::vector<core::DreamRecord> dreams = {
        lucidDream(1, "2024-01-01 06:00", "x", "Teeth falling"),
        lucidDream(2, "2024-01-02 06:00", "x", "flying"),
        lucidDream(3, "2024-01-03 06:00", "x", " teeth falling "),
        dream(4, "2024-01-04 06:00", "x"),
    };

    const auto signs = Analysis::DreamStatisticsCalculator::rankDreamSigns(dreams);
    ASSERT_EQ(signs.size(), 2u);
    EXPECT_EQ(signs[0], (core::WordCount{"teeth falling", 2}));
    EXPECT_EQ(signs[1], (core::WordCount{"flying", 1}));
}

TEST(DreamStatistics, WeeklySummaryWindowIsInclusive) {
    const std::vector<core::DreamRecord> dreams = {
        dream(1, "2024-01-31 23:59", "too early"),
        dream(2, "2024-02-01 00:00", "first day"),
        lucidDream(3, "2024-02-07 23:00", "last day here"),
        dream(4, "2024-02-08 00:00", "too late"),
    };

    const auto summary = Analysis::DreamStatisticsCalculator{}.weeklySummary(dreams, day("2024-02-07"));
    EXPECT_EQ(summary.from, day("2024-02-01"));
    EXPECT_EQ(summary.to, day("2024-02-07"));
    EXPECT_EQ(summary.dreams, 2u);
    EXPECT_EQ(summary.lucidDreams, 1u);
    EXPECT_DOUBLE_EQ(summary.dreamsPerDay, 2.0 / 7.0);
    ASSERT_TRUE(summary.averageWordCount.has_value());
    EXPECT_DOUBLE_EQ(*summary.averageWordCount, 2.5);
}

TEST(DreamStatistics, WeeklySummaryWithoutDreams) {
    const auto summary = Analysis::DreamStatisticsCalculator{}.weeklySummary({}, day("2024-02-07"));
    EXPECT_EQ(summary.dreams, 0u);
    EXPECT_DOUBLE_EQ(summary.dreamsPerDay, 0.0);
    EXPECT_FALSE(summary.averageWordCount.has_value());
}
