#pragma once

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "core/DreamRecord.hpp"
#include "core/StatisticsReport.hpp"

namespace LucidLog
{
    namespace Report
    {
        /**
         * ConsoleReporter
         *
         * Responsibilities:
         *  - Human-readable, sectioned text report of a StatisticsReport.
         *  - Bars for sleep duration and technique success rate.
         *  - Month calendar grid (weeks start on Monday).
         *
         * Design notes:
         *  - ANSI colours only when stdout is a terminal (or forced on).
         *  - "No data" values print as "no data", never as 0.
         */
        class ConsoleReporter
        {
        public:
            enum class Verbosity
            {
                QUIET,    // Headline numbers only
                NORMAL,   // Every section
                VERBOSE   // Every section plus per-night and per-day detail
            };

            explicit ConsoleReporter(Verbosity verbosity = Verbosity::NORMAL,
                                     std::ostream &output = std::cout);

            ConsoleReporter(const ConsoleReporter &)            = default;
            ConsoleReporter &operator=(const ConsoleReporter &) = default;

            void generateReport(const core::StatisticsReport &report);

            /// Print the dream ids (and titles) matching a search keyword.
            void printSearchResult(const std::string &keyword,
                                   const std::vector<core::DreamRecord::Id> &matches,
                                   const std::vector<core::DreamRecord> &dreams);

            void flush();

            void setVerbosity(Verbosity level) noexcept { m_verbosity = level; }
            void setEnableColors(bool enable) noexcept { m_colorsEnabled = enable; }

        private:
            void printDreamStats(const core::DreamStats &stats);
            void printWordRanking(const char *title, const std::vector<core::WordCount> &words);
            void printSleepStats(const core::SleepStats &stats);
            void printRealityChecks(const core::RealityCheckStats &stats);
            void printCalendar(const core::CalendarMonth &calendar);
            void printWeeklySummary(const core::WeeklySummary &summary);
            void printTechniques(const core::TechniqueSummary &summary);

            void printHeading(const std::string &title);

            const char *color(const char *code) const noexcept;

            static std::string formatOptional(const std::optional<double> &value, int precision,
                                              const char *suffix = "");
            static std::string bar(double fraction, int width);

        private:
            Verbosity     m_verbosity;
            bool          m_colorsEnabled;
            std::ostream *m_output;
        };

    } // namespace Report
} // namespace LucidLog
