#pragma once

#include <vector>

#include "core/Calendar.hpp"
#include "core/DreamRecord.hpp"
#include "core/StatisticsReport.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * CalendarRenderer
         *
         * Maps dream presence onto the days of one month. The result holds
         * exactly one cell per day of the month; leading/trailing padding
         * for a weekday grid is left to the presentation layer.
         */
        class CalendarRenderer
        {
        public:
            CalendarRenderer() = default;

            /// month must be valid (see Utils::isValidYearMonth).
            core::CalendarMonth render(const core::YearMonth &month,
                                       const std::vector<core::DreamRecord> &dreams) const;
        };

    } // namespace Analysis
} // namespace LucidLog
