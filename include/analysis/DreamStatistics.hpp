#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/Calendar.hpp"
#include "core/DreamRecord.hpp"
#include "core/StatisticsReport.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * DreamStatisticsCalculator
         *
         * Totals, lucidity rate and calendar groupings over the dream
         * collection. Grouping keys come from the creation date only; the
         * time of day is ignored.
         *
         * Stateless: all results are returned by value.
         */
        class DreamStatisticsCalculator
        {
        public:
            static constexpr int kWeekLength = 7;

            DreamStatisticsCalculator() = default;

            /// Totals, groupings, average length and dream-sign ranking.
            core::DreamStats compute(const std::vector<core::DreamRecord> &dreams) const;

            /**
             * Dreams created in the seven days ending at reference
             * (inclusive on both ends).
             */
            core::WeeklySummary weeklySummary(const std::vector<core::DreamRecord> &dreams,
                                              const core::Date &reference) const;

            /// lucid / total * 100, or 0 when total is 0.
            static double lucidPercentage(std::size_t lucid, std::size_t total) noexcept;

            /**
             * Frequency ranking of dream signs over lucid dreams.
             *
             * Signs are trimmed and lowercased before counting; blank signs
             * are skipped. Equal counts keep first-seen order.
             */
            static std::vector<core::WordCount> rankDreamSigns(const std::vector<core::DreamRecord> &dreams);
        };

    } // namespace Analysis
} // namespace LucidLog
