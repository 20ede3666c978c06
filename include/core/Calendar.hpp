// File: include/core/Calendar.hpp
//
// Civil calendar value types shared by the record model and the analysis
// layer. Dates are kept as plain year/month/day triples rather than
// system_clock time points, so grouping never depends on the host time zone.

#ifndef LUCIDLOG_CORE_CALENDAR_HPP
#define LUCIDLOG_CORE_CALENDAR_HPP

#include <cstdint>
#include <tuple>

namespace core
{

/**
 * @brief A proleptic Gregorian calendar date.
 *
 * No validation happens here; Utils::isValidDate() and the snapshot
 * validator decide whether a value is usable.
 */
struct Date
{
    int year{1970};
    int month{1};   ///< 1..12
    int day{1};     ///< 1..31
};

inline bool operator==(const Date& a, const Date& b) noexcept
{
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

inline bool operator!=(const Date& a, const Date& b) noexcept
{
    return !(a == b);
}

inline bool operator<(const Date& a, const Date& b) noexcept
{
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

inline bool operator>(const Date& a, const Date& b) noexcept { return b < a; }
inline bool operator<=(const Date& a, const Date& b) noexcept { return !(b < a); }
inline bool operator>=(const Date& a, const Date& b) noexcept { return !(a < b); }

/**
 * @brief Wall-clock time of day with minute resolution.
 */
struct TimeOfDay
{
    int hour{0};    ///< 0..23
    int minute{0};  ///< 0..59

    int minutesSinceMidnight() const noexcept
    {
        return hour * 60 + minute;
    }
};

inline bool operator==(const TimeOfDay& a, const TimeOfDay& b) noexcept
{
    return a.hour == b.hour && a.minute == b.minute;
}

inline bool operator!=(const TimeOfDay& a, const TimeOfDay& b) noexcept
{
    return !(a == b);
}

/// Creation timestamp of a record: a date plus a time of day.
struct DateTime
{
    Date      date{};
    TimeOfDay time{};
};

inline bool operator==(const DateTime& a, const DateTime& b) noexcept
{
    return a.date == b.date && a.time == b.time;
}

inline bool operator<(const DateTime& a, const DateTime& b) noexcept
{
    if (a.date != b.date)
        return a.date < b.date;
    return a.time.minutesSinceMidnight() < b.time.minutesSinceMidnight();
}

/// Month grouping key.
struct YearMonth
{
    int year{1970};
    int month{1};
};

inline bool operator==(const YearMonth& a, const YearMonth& b) noexcept
{
    return a.year == b.year && a.month == b.month;
}

inline bool operator!=(const YearMonth& a, const YearMonth& b) noexcept
{
    return !(a == b);
}

inline bool operator<(const YearMonth& a, const YearMonth& b) noexcept
{
    return std::tie(a.year, a.month) < std::tie(b.year, b.month);
}

/**
 * @brief ISO-8601 week key.
 *
 * weekYear can differ from the calendar year for days at the very start or
 * end of a year (e.g. 2024-12-30 belongs to 2025-W01).
 */
struct IsoWeek
{
    int weekYear{1970};
    int week{1};    ///< 1..53
};

inline bool operator==(const IsoWeek& a, const IsoWeek& b) noexcept
{
    return a.weekYear == b.weekYear && a.week == b.week;
}

inline bool operator<(const IsoWeek& a, const IsoWeek& b) noexcept
{
    return std::tie(a.weekYear, a.week) < std::tie(b.weekYear, b.week);
}

} // namespace core

#endif // LUCIDLOG_CORE_CALENDAR_HPP
