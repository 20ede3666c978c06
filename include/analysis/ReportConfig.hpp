#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/AnalysisError.hpp"
#include "core/Calendar.hpp"
#include "utils/ConfigLoader.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * ReportConfig
         *
         * Parameters of one report request. Defaults: ten top words, the
         * current month for the calendar, the built-in stop-word list,
         * minimum word length 3, content only (no titles), and today as the
         * end of the weekly window.
         */
        struct ReportConfig
        {
            static constexpr int kDefaultTopWords = 10;

            ReportConfig();

            int                      topWords;
            core::YearMonth          calendarMonth;
            std::vector<std::string> stopWords;
            int                      minWordLength;
            bool                     includeTitles;
            core::Date               referenceDate;
        };

        /// First invalid setting, if any.
        std::optional<core::AnalysisError> validateConfig(const ReportConfig &config);

        /**
         * Apply the recognised keys of a loaded configuration file on top of
         * config. Keys that are absent leave the current value untouched; a
         * value that cannot be parsed is reported as a ConfigurationError
         * naming the key.
         *
         * Recognised keys: see reportConfigKeys().
         */
        std::optional<core::AnalysisError> loadReportConfig(const Utils::ConfigLoader &loader,
                                                              ReportConfig &config);

        /// Configuration keys read by loadReportConfig().
        const std::vector<std::string> &reportConfigKeys();

    } // namespace Analysis
} // namespace LucidLog
