#include "analysis/SleepStatistics.hpp"
#include <gtest/gtest.h>

#include <algorithm>

#include "TestJournal.hpp"

using namespace LucidLog;
using Analysis::SleepStatisticsCalculator;
using Testing::timeOfDay;
using Testing::dailyLog;
using Testing::dream;
using Testing::lucidDream;

TEST(SleepStatistics, DurationAcrossMidnight) {
    EXPECT_DOUBLE_EQ(SleepStatisticsCalculator::durationHours(timeOfDay("23:00"), timeOfDay("07:00")), 8.0);
    EXPECT_EQ(SleepStatisticsCalculator::durationMinutes(timeOfDay("01:30"), timeOfDay("09:00")), 450);
    EXPECT_EQ(SleepStatisticsCalculator::durationMinutes(timeOfDay("07:00"), timeOfDay("07:00")), 0);
}

TEST(SleepStatistics, SingleNightScenario) {
    const std::vector<core::DailyLog> logs = {dailyLog("2024-02-01", "23:00", "07:00", 4)};

    const auto stats = SleepStatisticsCalculator{}.compute(logs, {});
    EXPECT_EQ(stats.nightsTracked, 1u);
    ASSERT_TRUE(stats.averageDurationHours.has_value());
    EXPECT_DOUBLE_EQ(*stats.averageDurationHours, 8.0);
    ASSERT_EQ(stats.durations.size(), 1u);
    EXPECT_DOUBLE_EQ(stats.durations[0].hours, 8.0);
    EXPECT_DOUBLE_EQ(*stats.averageQuality, 4.0);
}

TEST(SleepStatistics, AverageIndependentOfOrder) {
    std::vector<core::DailyLog> logs = {
        dailyLog("2024-02-01", "23:10", "06:55", 3),
        dailyLog("2024-02-02", "00:20", "08:05", 4),
        dailyLog("2024-02-03", "22:45", "05:15", 2),
        dailyLog("2024-02-04", "01:00", "09:40", 5),
    };

    const auto reference = SleepStatisticsCalculator{}.compute(logs, {});
    std::sort(logs.begin(), logs.end(),
              [](const core::DailyLog &a, const core::DailyLog &b) { return b.date() < a.date(); });
    const auto reversed = SleepStatisticsCalculator{}.compute(logs, {});
    std::rotate(logs.begin(), logs.begin() + 1, logs.end());
    const auto rotated = SleepStatisticsCalculator{}.compute(logs, {});

    EXPECT_EQ(*reference.averageDurationHours, *reversed.averageDurationHours);
    EXPECT_EQ(*reference.averageDurationHours, *rotated.averageDurationHours);
    EXPECT_EQ(reference.durations.front().date, reversed.durations.front().date);
    EXPECT_DOUBLE_EQ(*reference.minDurationHours, 6.5);
    EXPECT_DOUBLE_EQ(*reference.maxDurationHours, 8.0 + 40.0 / 60.0);
}

TEST(SleepStatistics, LucidNightsAndQuality) {
    const std::vector<core::DailyLog> logs = {
        dailyLog("2024-03-01", "23:00", "07:00", 5),
        dailyLog("2024-03-02", "23:00", "07:00", 2),
        dailyLog("2024-03-03", "23:00", "07:00", 4),
    };
    const std::vector<core::DreamRecord> dreams = {
        lucidDream(1, "2024-03-01 06:00", "a"),
        dream(2, "2024-03-01 07:00", "b"),
        dream(3, "2024-03-02 06:00", "c"),
        lucidDream(4, "2024-03-03 05:00", "d"),
    };

    const auto stats = SleepStatisticsCalculator{}.compute(logs, dreams);
    ASSERT_TRUE(stats.lucidNightPercentage.has_value());
    EXPECT_NEAR(*stats.lucidNightPercentage, 200.0 / 3.0, 1e-9);
    ASSERT_TRUE(stats.averageQualityOnLucidNights.has_value());
    EXPECT_DOUBLE_EQ(*stats.averageQualityOnLucidNights, 4.5);
}

TEST(SleepStatistics, QualityVsLucidityTable) {
    const std::vector<core::DailyLog> logs = {
        dailyLog("2024-03-01", "23:00", "07:00", 4),
        dailyLog("2024-03-02", "23:00", "07:00", 4),
        dailyLog("2024-03-03", "23:00", "07:00", 2),
        dailyLog("2024-03-04", "23:00", "07:00", 4),  // no dream that day
    };
    const std::vector<core::DreamRecord> dreams = {
        lucidDream(1, "2024-03-01 06:00", "a"),
        dream(2, "2024-03-02 06:00", "b"),
        dream(3, "2024-03-03 06:00", "c"),
        lucidDream(4, "2024-03-05 06:00", "no log that day"),
    };

    const auto table = SleepStatisticsCalculator::qualityVsLucidity(logs, dreams);
    ASSERT_EQ(table.size(), 5u);
    for (int q = 1; q <= 5; ++q)
        EXPECT_EQ(table[static_cast<std::size_t>(q - 1)].quality, q);

    EXPECT_EQ(table[3].dreamDays, 2u);
    EXPECT_EQ(table[3].lucidDreamDays, 1u);
    ASSERT_TRUE(table[3].lucidityRate.has_value());
    EXPECT_DOUBLE_EQ(*table[3].lucidityRate, 0.5);

    EXPECT_EQ(table[1].dreamDays, 1u);
    EXPECT_DOUBLE_EQ(*table[1].lucidityRate, 0.0);

    EXPECT_FALSE(table[0].lucidityRate.has_value());
    EXPECT_FALSE(table[4].lucidityRate.has_value());
}

TEST(SleepStatistics, NoLogsMeansNoData) {
    const auto stats = SleepStatisticsCalculator{}.compute({}, {});
    EXPECT_EQ(stats.nightsTracked, 0u);
    EXPECT_FALSE(stats.averageDurationHours.has_value());
    EXPECT_FALSE(stats.averageQuality.has_value());
    EXPECT_FALSE(stats.minDurationHours.has_value());
    EXPECT_FALSE(stats.lucidNightPercentage.has_value());
    EXPECT_FALSE(stats.averageQualityOnLucidNights.has_value());
    EXPECT_TRUE(stats.durations.empty());
    EXPECT_EQ(stats.qualityVsLucidity.size(), 5u);
}
