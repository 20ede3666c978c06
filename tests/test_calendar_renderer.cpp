#include "analysis/CalendarRenderer.hpp"
#include <gtest/gtest.h>

#include "TestJournal.hpp"

using namespace LucidLog;
using Testing::dream;
using Testing::lucidDream;

TEST(CalendarRenderer, EmptyMonthHasNoEntries) {
    const auto calendar = Analysis::CalendarRenderer{}.render(core::YearMonth{2024, 2}, {});

    ASSERT_EQ(calendar.days.size(), 29u);
    for (const auto &cell : calendar.days)
    {
        EXPECT_EQ(cell.mark, core::DayMark::NoEntry);
        EXPECT_EQ(cell.dreamCount, 0u);
    }
    EXPECT_EQ(calendar.days.front().date, (core::Date{2024, 2, 1}));
    EXPECT_EQ(calendar.days.back().date, (core::Date{2024, 2, 29}));
}

TEST(CalendarRenderer, LucidTakesPrecedence) {
    const std::vector<core::DreamRecord> dreams = {
        dream(1, "2024-01-01 06:00", "a"),
        lucidDream(2, "2024-01-01 06:30", "b"),
        dream(3, "2024-01-01 07:00", "c"),
        dream(4, "2024-01-02 07:00", "d"),
    };

    const auto calendar = Analysis::CalendarRenderer{}.render(core::YearMonth{2024, 1}, dreams);
    ASSERT_EQ(calendar.days.size(), 31u);
    EXPECT_EQ(calendar.days[0].mark, core::DayMark::LucidDreamLogged);
    EXPECT_EQ(calendar.days[0].dreamCount, 3u);
    EXPECT_EQ(calendar.days[1].mark, core::DayMark::DreamLogged);
    EXPECT_EQ(calendar.days[2].mark, core::DayMark::NoEntry);
}

TEST(CalendarRenderer, IgnoresOtherMonths) {
    const std::vector<core::DreamRecord> dreams = {
        dream(1, "2023-01-15 06:00", "same month, other year"),
        dream(2, "2024-02-15 06:00", "other month"),
    };

    const auto calendar = Analysis::CalendarRenderer{}.render(core::YearMonth{2024, 1}, dreams);
    for (const auto &cell : calendar.days)
        EXPECT_EQ(cell.mark, core::DayMark::NoEntry);
}
