#pragma once

#include <vector>

#include "core/StatisticsReport.hpp"
#include "core/TechniquePractice.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * TechniqueEffectivenessAnalyzer
         *
         * Groups practice sessions by technique name and rates each one.
         * A session counts as a success when it reached partial or full
         * lucidity.
         */
        class TechniqueEffectivenessAnalyzer
        {
        public:
            /// Success rates (percent) above these thresholds change the recommendation.
            static constexpr double kPrimaryThreshold = 70.0;
            static constexpr double kCombineThreshold = 40.0;

            TechniqueEffectivenessAnalyzer() = default;

            core::TechniqueSummary analyze(const std::vector<core::TechniquePractice> &practices) const;

            static core::TechniqueRecommendation recommend(double successRate) noexcept;
        };

    } // namespace Analysis
} // namespace LucidLog
