#include "utils/TimeUtils.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace LucidLog
{
    namespace Utils
    {
        // -------- Wall clock --------

        TimePoint now() noexcept
        {
            return Clock::now();
        }

        namespace
        {
            std::tm localTm(TimePoint tp)
            {
                std::time_t t = Clock::to_time_t(tp);
                std::tm tm_buf{};
            #if defined(_WIN32)
                localtime_s(&tm_buf, &t);
            #else
                localtime_r(&t, &tm_buf);
            #endif
                return tm_buf;
            }

            // Parse a fixed-width run of digits; std::nullopt on any non-digit.
            std::optional<int> parseIntField(std::string_view sv)
            {
                if (sv.empty())
                {
                    return std::nullopt;
                }

                int value = 0;
                for (char c : sv)
                {
                    if (c < '0' || c > '9')
                    {
                        return std::nullopt;
                    }
                    value = value * 10 + (c - '0');
                }
                return value;
            }

            std::string twoDigits(int v)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "%02d", v);
                return buf;
            }

            std::string fourDigits(int v)
            {
                char buf[16];
                std::snprintf(buf, sizeof(buf), "%04d", v);
                return buf;
            }
        } // anonymous namespace

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            const std::tm tm_buf = localTm(tp);

            // std::put_time needs a null-terminated format string.
            const std::string fmt(format);
            std::ostringstream oss;
            oss << std::put_time(&tm_buf, fmt.c_str());
            return oss.str();
        }

        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept
        {
            return std::chrono::duration_cast<milliseconds>(end - start).count();
        }

        // -------- Calendar arithmetic --------

        bool isLeapYear(int year) noexcept
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        int daysInMonth(int year, int month) noexcept
        {
            static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month < 1 || month > 12)
            {
                return 0;
            }
            if (month == 2 && isLeapYear(year))
            {
                return 29;
            }
            return kDays[month - 1];
        }

        bool isValidDate(const core::Date &date) noexcept
        {
            return date.year >= 1 && date.year <= 9999 &&
                   date.month >= 1 && date.month <= 12 &&
                   date.day >= 1 && date.day <= daysInMonth(date.year, date.month);
        }

        bool isValidTime(const core::TimeOfDay &time) noexcept
        {
            return time.hour >= 0 && time.hour <= 23 &&
                   time.minute >= 0 && time.minute <= 59;
        }

        bool isValidYearMonth(const core::YearMonth &ym) noexcept
        {
            return ym.year >= 1 && ym.year <= 9999 && ym.month >= 1 && ym.month <= 12;
        }

        // Days-from-civil / civil-from-days over the proleptic Gregorian
        // calendar, using 400-year eras of 146097 days.
        std::int64_t toDayNumber(const core::Date &date) noexcept
        {
            const std::int64_t y   = static_cast<std::int64_t>(date.year) - (date.month <= 2 ? 1 : 0);
            const std::int64_t m   = date.month;
            const std::int64_t d   = date.day;
            const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
            const std::int64_t yoe = y - era * 400;
            const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        core::Date fromDayNumber(std::int64_t days) noexcept
        {
            const std::int64_t z   = days + 719468;
            const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
            const std::int64_t doe = z - era * 146097;
            const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const std::int64_t mp  = (5 * doy + 2) / 153;
            const std::int64_t d   = doy - (153 * mp + 2) / 5 + 1;
            const std::int64_t m   = mp < 10 ? mp + 3 : mp - 9;
            const std::int64_t y   = yoe + era * 400 + (m <= 2 ? 1 : 0);

            return core::Date{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
        }

        core::Date addDays(const core::Date &date, int days) noexcept
        {
            return fromDayNumber(toDayNumber(date) + days);
        }

        int isoWeekday(const core::Date &date) noexcept
        {
            // Day 0 (1970-01-01) was a Thursday.
            const std::int64_t n = toDayNumber(date);
            const std::int64_t mondayBased = ((n % 7) + 7 + 3) % 7;
            return static_cast<int>(mondayBased) + 1;
        }

        core::IsoWeek isoWeekOf(const core::Date &date) noexcept
        {
            const core::Date thursday = addDays(date, 4 - isoWeekday(date));
            const std::int64_t ordinal =
                toDayNumber(thursday) - toDayNumber(core::Date{thursday.year, 1, 1});
            return core::IsoWeek{thursday.year, static_cast<int>(ordinal / 7) + 1};
        }

        core::Date today()
        {
            const std::tm tm_buf = localTm(now());
            return core::Date{tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday};
        }

        core::YearMonth currentYearMonth()
        {
            return yearMonthOf(today());
        }

        // -------- Parsing --------

        std::optional<core::Date> parseDate(std::string_view sv)
        {
            // Expected format: "YYYY-MM-DD"
            if (sv.size() != 10 || sv[4] != '-' || sv[7] != '-')
            {
                return std::nullopt;
            }

            const auto year  = parseIntField(sv.substr(0, 4));
            const auto month = parseIntField(sv.substr(5, 2));
            const auto day   = parseIntField(sv.substr(8, 2));
            if (!year || !month || !day)
            {
                return std::nullopt;
            }

            const core::Date date{*year, *month, *day};
            if (!isValidDate(date))
            {
                return std::nullopt;
            }
            return date;
        }

        std::optional<core::TimeOfDay> parseTimeOfDay(std::string_view sv)
        {
            // Expected format: "HH:MM"
            if (sv.size() != 5 || sv[2] != ':')
            {
                return std::nullopt;
            }

            const auto hour   = parseIntField(sv.substr(0, 2));
            const auto minute = parseIntField(sv.substr(3, 2));
            if (!hour || !minute)
            {
                return std::nullopt;
            }

            const core::TimeOfDay time{*hour, *minute};
            if (!isValidTime(time))
            {
                return std::nullopt;
            }
            return time;
        }

        std::optional<core::DateTime> parseDateTime(std::string_view sv)
        {
            // "YYYY-MM-DD HH:MM" or "YYYY-MM-DD HH:MM:SS"; 'T' is accepted as separator.
            if (sv.size() != 16 && sv.size() != 19)
            {
                return std::nullopt;
            }
            if (sv[10] != ' ' && sv[10] != 'T')
            {
                return std::nullopt;
            }

            const auto date = parseDate(sv.substr(0, 10));
            const auto time = parseTimeOfDay(sv.substr(11, 5));
            if (!date || !time)
            {
                return std::nullopt;
            }

            if (sv.size() == 19)
            {
                const auto sec = parseIntField(sv.substr(17, 2));
                if (sv[16] != ':' || !sec || *sec > 59)
                {
                    return std::nullopt;
                }
            }

            return core::DateTime{*date, *time};
        }

        std::optional<core::YearMonth> parseYearMonth(std::string_view sv)
        {
            // Expected format: "YYYY-MM"
            if (sv.size() != 7 || sv[4] != '-')
            {
                return std::nullopt;
            }

            const auto year  = parseIntField(sv.substr(0, 4));
            const auto month = parseIntField(sv.substr(5, 2));
            if (!year || !month)
            {
                return std::nullopt;
            }

            const core::YearMonth ym{*year, *month};
            if (!isValidYearMonth(ym))
            {
                return std::nullopt;
            }
            return ym;
        }

        // -------- Formatting --------

        std::string formatDate(const core::Date &date)
        {
            return fourDigits(date.year) + "-" + twoDigits(date.month) + "-" + twoDigits(date.day);
        }

        std::string formatTimeOfDay(const core::TimeOfDay &time)
        {
            return twoDigits(time.hour) + ":" + twoDigits(time.minute);
        }

        std::string formatDateTime(const core::DateTime &dt)
        {
            return formatDate(dt.date) + " " + formatTimeOfDay(dt.time);
        }

        std::string formatYearMonth(const core::YearMonth &ym)
        {
            return fourDigits(ym.year) + "-" + twoDigits(ym.month);
        }

        std::string formatIsoWeek(const core::IsoWeek &week)
        {
            return fourDigits(week.weekYear) + "-W" + twoDigits(week.week);
        }

        const char *monthName(int month) noexcept
        {
            static const char *const kNames[12] = {
                "January", "February", "March", "April", "May", "June",
                "July", "August", "September", "October", "November", "December"};
            if (month < 1 || month > 12)
            {
                return "";
            }
            return kNames[month - 1];
        }

        // -------- ScopedTimer (RAII) --------

        ScopedTimer::ScopedTimer(TimePoint &target) noexcept
            : target_(target),
              start_(Clock::now()),
              moved_(false)
        {
        }

        ScopedTimer::ScopedTimer(ScopedTimer &&other) noexcept
            : target_(other.target_),
              start_(other.start_),
              moved_(false)
        {
            other.moved_ = true;
        }

        ScopedTimer::~ScopedTimer() noexcept
        {
            if (!moved_)
            {
                // Store the scope end time into the referenced TimePoint.
                target_ = Clock::now();
            }
        }

    } // namespace Utils
} // namespace LucidLog
