#pragma once

#include <optional>

#include "analysis/ReportConfig.hpp"
#include "core/AnalysisError.hpp"
#include "core/JournalSnapshot.hpp"
#include "core/StatisticsReport.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * ReportAssembler
         *
         * Responsibilities:
         *  - Validate the request and the snapshot before any metric is computed.
         *  - Run every calculator over the same snapshot and bundle the results.
         *
         * Design notes:
         *  - No state between calls; two threads may assemble reports over the
         *    same (or different) snapshots concurrently.
         *  - Equal inputs always produce equal reports.
         */
        class ReportAssembler
        {
        public:
            /// Exactly one of report / error is set.
            struct AssemblyResult
            {
                std::optional<core::StatisticsReport> report;
                std::optional<core::AnalysisError>    error;

                bool ok() const noexcept { return report.has_value(); }
            };

            ReportAssembler() = default;

            AssemblyResult assemble(const core::JournalSnapshot &snapshot,
                                    const ReportConfig &config) const;
        };

    } // namespace Analysis
} // namespace LucidLog
