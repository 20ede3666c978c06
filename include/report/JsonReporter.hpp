#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "core/DreamRecord.hpp"
#include "core/StatisticsReport.hpp"

namespace LucidLog
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Responsibilities:
         *  - Serialise a StatisticsReport as RFC 8259 JSON.
         *  - Render every "no data" value as null.
         *
         * Design notes:
         *  - Hand-written output, no JSON library.
         *  - Deterministic: the same report always yields the same bytes
         *    (no generation timestamp, fixed number formatting, map order).
         *  - Pretty mode puts each top-level section on its own indented
         *    line; the sections themselves stay compact.
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,
                PRETTY
            };

            explicit JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            void generateReport(const core::StatisticsReport &report);

            /// Adds a "search" section listing the matching dream ids.
            void setSearchResult(std::string keyword, std::vector<core::DreamRecord::Id> matches);

            void writeJson(std::ostream &output) const;

            std::string getJsonString() const;

            void setPrettyPrint(PrettyPrint mode) noexcept { m_prettyPrint = mode; }

            // Section serialisers, public for focused tests.
            static std::string dreamStatsToJson(const core::DreamStats &stats);
            static std::string weeklySummaryToJson(const core::WeeklySummary &summary);
            static std::string sleepStatsToJson(const core::SleepStats &stats);
            static std::string realityChecksToJson(const core::RealityCheckStats &stats);
            static std::string calendarToJson(const core::CalendarMonth &calendar);
            static std::string techniquesToJson(const core::TechniqueSummary &summary);
            static std::string wordCountsToJson(const std::vector<core::WordCount> &words);

            /// Fixed four-decimal rendering used for every non-integer number.
            static std::string formatNumber(double value);

        private:
            struct SearchResult
            {
                std::string keyword;
                std::vector<core::DreamRecord::Id> matches;
            };

            std::vector<std::pair<std::string, std::string>> sections() const;

        private:
            core::StatisticsReport      m_report;
            std::optional<SearchResult> m_search;
            PrettyPrint                 m_prettyPrint;
        };

    } // namespace Report
} // namespace LucidLog
