#include "utils/TimeUtils.hpp"
#include <gtest/gtest.h>

using namespace LucidLog;

TEST(TimeUtils, LeapYears) {
    EXPECT_TRUE(Utils::isLeapYear(2024));
    EXPECT_TRUE(Utils::isLeapYear(2000));
    EXPECT_FALSE(Utils::isLeapYear(1900));
    EXPECT_FALSE(Utils::isLeapYear(2023));

    EXPECT_EQ(Utils::daysInMonth(2024, 2), 29);
    EXPECT_EQ(Utils::daysInMonth(2023, 2), 28);
    EXPECT_EQ(Utils::daysInMonth(2024, 4), 30);
    EXPECT_EQ(Utils::daysInMonth(2024, 13), 0);
}

TEST(TimeUtils, DayNumberEpoch) {
    EXPECT_EQ(Utils::toDayNumber(core::Date{1970, 1, 1}), 0);
    EXPECT_EQ(Utils::fromDayNumber(0), (core::Date{1970, 1, 1}));
    EXPECT_EQ(Utils::toDayNumber(core::Date{1969, 12, 31}), -1);
}

TEST(TimeUtils, AddDaysCrossesMonthAndYear) {
    EXPECT_EQ(Utils::addDays(core::Date{2024, 3, 1}, -1), (core::Date{2024, 2, 29}));
    EXPECT_EQ(Utils::addDays(core::Date{2023, 12, 31}, 1), (core::Date{2024, 1, 1}));
    EXPECT_EQ(Utils::addDays(core::Date{2024, 1, 7}, -6), (core::Date{2024, 1, 1}));
}

TEST(TimeUtils, IsoWeekday) {
    EXPECT_EQ(Utils::isoWeekday(core::Date{2024, 1, 1}), 1);  // Monday
    EXPECT_EQ(Utils::isoWeekday(core::Date{2024, 2, 1}), 4);  // Thursday
    EXPECT_EQ(Utils::isoWeekday(core::Date{2024, 3, 3}), 7);  // Sunday
}

TEST(TimeUtils, IsoWeekAtYearBoundaries) {
    EXPECT_EQ(Utils::isoWeekOf(core::Date{2024, 1, 1}), (core::IsoWeek{2024, 1}));
    EXPECT_EQ(Utils::isoWeekOf(core::Date{2024, 12, 30}), (core::IsoWeek{2025, 1}));
    EXPECT_EQ(Utils::isoWeekOf(core::Date{2021, 1, 3}), (core::IsoWeek{2020, 53}));
    EXPECT_EQ(Utils::formatIsoWeek(core::IsoWeek{2020, 53}), "2020-W53");
}

TEST(TimeUtils, ParseDateRejectsImpossibleDates) {
    EXPECT_TRUE(Utils::parseDate("2024-02-29").has_value());
    EXPECT_FALSE(Utils::parseDate("2023-02-29").has_value());
    EXPECT_FALSE(Utils::parseDate("2024-13-01").has_value());
    EXPECT_FALSE(Utils::parseDate("2024-1-01").has_value());
    EXPECT_FALSE(Utils::parseDate("").has_value());
}

TEST(TimeUtils, ParseTimeAndDateTime) {
    const auto t = Utils::parseTimeOfDay("23:45");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->minutesSinceMidnight(), 23 * 60 + 45);
    EXPECT_FALSE(Utils::parseTimeOfDay("24:00").has_value());

    const auto dt = Utils::parseDateTime("2024-02-01T06:30:15");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(Utils::formatDateTime(*dt), "2024-02-01 06:30");
    EXPECT_FALSE(Utils::parseDateTime("2024-02-01 6:30").has_value());
}

TEST(TimeUtils, YearMonth) {
    const auto ym = Utils::parseYearMonth("2024-02");
    ASSERT_TRUE(ym.has_value());
    EXPECT_EQ(Utils::formatYearMonth(*ym), "2024-02");
    EXPECT_FALSE(Utils::parseYearMonth("2024-00").has_value());
    EXPECT_FALSE(Utils::parseYearMonth("0000-05").has_value());
    EXPECT_STREQ(Utils::monthName(2), "February");
}
