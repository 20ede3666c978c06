#pragma once

#include <vector>

#include "core/Calendar.hpp"
#include "core/DailyLog.hpp"
#include "core/DreamRecord.hpp"
#include "core/StatisticsReport.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * SleepStatisticsCalculator
         *
         * Sleep duration and quality aggregates over daily logs, and the
         * bucketed sleep-quality vs lucidity table.
         *
         * Durations are accumulated in whole minutes, so averages do not
         * depend on the order of the input logs.
         */
        class SleepStatisticsCalculator
        {
        public:
            static constexpr int kMinQuality = 1;
            static constexpr int kMaxQuality = 5;
            static constexpr int kMinutesPerDay = 24 * 60;

            SleepStatisticsCalculator() = default;

            core::SleepStats compute(const std::vector<core::DailyLog> &logs,
                                     const std::vector<core::DreamRecord> &dreams) const;

            /// (wake - bedtime) mod 24h, in minutes. Equal times yield 0.
            static int durationMinutes(const core::TimeOfDay &bedtime,
                                       const core::TimeOfDay &wakeTime) noexcept;

            /// durationMinutes() expressed in fractional hours.
            static double durationHours(const core::TimeOfDay &bedtime,
                                        const core::TimeOfDay &wakeTime) noexcept;

            /**
             * Quality 1..5 -> lucidity rate over dream-days.
             *
             * A dream-day is a date that has a daily log and at least one
             * dream; it counts as lucid when any dream that day was lucid.
             * Rows without observations have no rate.
             */
            static std::vector<core::QualityBucket> qualityVsLucidity(const std::vector<core::DailyLog> &logs,
                                                                     const std::vector<core::DreamRecord> &dreams);
        };

    } // namespace Analysis
} // namespace LucidLog
