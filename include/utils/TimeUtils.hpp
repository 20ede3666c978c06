#pragma once

#include <chrono>
#include <ctime>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "core/Calendar.hpp"

namespace LucidLog
{
    namespace Utils
    {
        /**
         * Time utilities for the journal reader, the analysis layer and logging.
         *
         * Design goals:
         *  - Wall-clock helpers (now, formatting) use std::chrono::system_clock.
         *  - Calendar arithmetic works on core::Date values only and never
         *    consults the host time zone, so grouping results are identical
         *    on every machine.
         *  - Parsing functions return std::optional to signal failures instead of throwing.
         *  - No global mutable state; all functions are thread-safe.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using milliseconds = std::chrono::milliseconds;

        /// Get current system time as TimePoint.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint into a human-readable local timestamp string.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS" (used for log lines).
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// Compute the duration between two time points in milliseconds.
        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept;

        // -------- Calendar arithmetic --------

        bool isLeapYear(int year) noexcept;

        /// Number of days in the given month (1..12); 0 for an invalid month.
        int daysInMonth(int year, int month) noexcept;

        bool isValidDate(const core::Date &date) noexcept;
        bool isValidTime(const core::TimeOfDay &time) noexcept;

        /// Year 1..9999, month 1..12.
        bool isValidYearMonth(const core::YearMonth &ym) noexcept;

        /// Days since 1970-01-01 (negative before the epoch).
        std::int64_t toDayNumber(const core::Date &date) noexcept;

        /// Inverse of toDayNumber().
        core::Date fromDayNumber(std::int64_t days) noexcept;

        core::Date addDays(const core::Date &date, int days) noexcept;

        /// ISO weekday: 1 = Monday ... 7 = Sunday.
        int isoWeekday(const core::Date &date) noexcept;

        /**
         * ISO-8601 week of a date.
         *
         * The week belongs to the year that contains its Thursday.
         */
        core::IsoWeek isoWeekOf(const core::Date &date) noexcept;

        inline core::YearMonth yearMonthOf(const core::Date &date) noexcept
        {
            return core::YearMonth{date.year, date.month};
        }

        /// Today's date in the local time zone of the host.
        core::Date today();

        /// Current month in the local time zone of the host.
        core::YearMonth currentYearMonth();

        // -------- Parsing --------

        /// Parse "YYYY-MM-DD"; validates the calendar date.
        std::optional<core::Date> parseDate(std::string_view sv);

        /// Parse "HH:MM"; validates the ranges.
        std::optional<core::TimeOfDay> parseTimeOfDay(std::string_view sv);

        /// Parse "YYYY-MM-DD HH:MM" (a trailing ":SS" is accepted and ignored).
        std::optional<core::DateTime> parseDateTime(std::string_view sv);

        /// Parse "YYYY-MM"; validates the month.
        std::optional<core::YearMonth> parseYearMonth(std::string_view sv);

        // -------- Formatting --------

        std::string formatDate(const core::Date &date);            ///< "YYYY-MM-DD"
        std::string formatTimeOfDay(const core::TimeOfDay &time);  ///< "HH:MM"
        std::string formatDateTime(const core::DateTime &dt);      ///< "YYYY-MM-DD HH:MM"
        std::string formatYearMonth(const core::YearMonth &ym);    ///< "YYYY-MM"
        std::string formatIsoWeek(const core::IsoWeek &week);      ///< "YYYY-Www"

        /// English month name, e.g. "February".
        const char *monthName(int month) noexcept;

        /**
         * Simple scoped timer utility (RAII) to measure elapsed wall-clock time
         * of a code block.
         *
         * Usage:
         *  {
         *      ScopedTimer timer(endTimePoint);
         *      // work...
         *  }
         *  // endTimePoint now holds the time when the scope ended.
         */
        class ScopedTimer
        {
        public:
            explicit ScopedTimer(TimePoint &target) noexcept;
            ScopedTimer(const ScopedTimer &)            = delete;
            ScopedTimer &operator=(const ScopedTimer &) = delete;
            ScopedTimer(ScopedTimer &&other) noexcept;
            ScopedTimer &operator=(ScopedTimer &&) = delete;
            ~ScopedTimer() noexcept;

        private:
            TimePoint &target_;
            TimePoint  start_;
            bool       moved_ { false };
        };

    } // namespace Utils
} // namespace LucidLog
