#pragma once

#include <vector>

#include "core/DailyLog.hpp"
#include "core/StatisticsReport.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * RealityCheckAggregator
         *
         * Only dates that have a daily log take part: a date missing from the
         * log is unknown, not a zero-check day. Ties for most/least active
         * day go to the earliest date.
         */
        class RealityCheckAggregator
        {
        public:
            RealityCheckAggregator() = default;

            core::RealityCheckStats aggregate(const std::vector<core::DailyLog> &logs) const;
        };

    } // namespace Analysis
} // namespace LucidLog
