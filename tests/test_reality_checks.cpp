#include "analysis/RealityCheckAggregator.hpp"
#include <gtest/gtest.h>

#include "TestJournal.hpp"

using namespace LucidLog;
using Testing::dailyLog;
using Testing::day;

TEST(RealityChecks, DaysWithoutLogAreExcluded) {
    // 2024-03-02 has no log at all.
    const std::vector<core::DailyLog> logs = {
        dailyLog("2024-03-01", "23:00", "07:00", 3, 5),
        dailyLog("2024-03-03", "23:00", "07:00", 3, 2),
    };

    const auto stats = Analysis::RealityCheckAggregator{}.aggregate(logs);
    EXPECT_EQ(stats.total, 7);
    EXPECT_EQ(stats.loggedDays, 2u);
    ASSERT_TRUE(stats.mostActiveDay.has_value());
    EXPECT_EQ(stats.mostActiveDay->date, day("2024-03-01"));
    ASSERT_TRUE(stats.leastActiveDay.has_value());
    EXPECT_EQ(stats.leastActiveDay->date, day("2024-03-03"));
    ASSERT_TRUE(stats.averagePerDay.has_value());
    EXPECT_DOUBLE_EQ(*stats.averagePerDay, 3.5);
}

TEST(RealityChecks, LoggedZeroCountsAsLeastActive) {
    const std::vector<core::DailyLog> logs = {
        dailyLog("2024-03-01", "23:00", "07:00", 3, 5),
        dailyLog("2024-03-02", "23:00", "07:00", 3, 0),
    };

    const auto stats = Analysis::RealityCheckAggregator{}.aggregate(logs);
    EXPECT_EQ(stats.leastActiveDay->date, day("2024-03-02"));
    EXPECT_EQ(stats.leastActiveDay->count, 0);
}

TEST(RealityChecks, TiesGoToEarliestDateRegardlessOfOrder) {
    const std::vector<core::DailyLog> logs = {
        dailyLog("2024-03-05", "23:00", "07:00", 3, 4),
        dailyLog("2024-03-02", "23:00", "07:00", 3, 4),
        dailyLog("2024-03-09", "23:00", "07:00", 3, 1),
        dailyLog("2024-03-04", "23:00", "07:00", 3, 1),
    };

    const auto stats = Analysis::RealityCheckAggregator{}.aggregate(logs);
    EXPECT_EQ(stats.mostActiveDay->date, day("2024-03-02"));
    EXPECT_EQ(stats.leastActiveDay->date, day("2024-03-04"));
}

TEST(RealityChecks, EmptyLogCollection) {
    const auto stats = Analysis::RealityCheckAggregator{}.aggregate({});
    EXPECT_EQ(stats.total, 0);
    EXPECT_EQ(stats.loggedDays, 0u);
    EXPECT_FALSE(stats.mostActiveDay.has_value());
    EXPECT_FALSE(stats.leastActiveDay.has_value());
    EXPECT_FALSE(stats.averagePerDay.has_value());
}
