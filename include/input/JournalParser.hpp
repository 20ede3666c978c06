#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "core/DailyLog.hpp"
#include "core/DreamRecord.hpp"
#include "core/JournalSnapshot.hpp"
#include "core/TechniquePractice.hpp"
#include "input/FileReader.hpp"

namespace LucidLog
{
    namespace Input
    {
        /**
         * JournalParser
         *
         * Turns the line-based journal export into a core::JournalSnapshot.
         *
         * Line format ('|' separated; "\|", "\\" and "\n" escapes):
         *   dream|<id>|<YYYY-MM-DD HH:MM>|<0|1>|<dream sign>|<title>|<tag,tag>|<content>
         *   log|<YYYY-MM-DD>|<HH:MM bed>|<HH:MM wake>|<quality>|<reality checks>|<wake feeling>|<note>|<id,id>
         *   practice|<technique>|<YYYY-MM-DD>|<minutes>|<unattempted|failed|partial|full[:level]>
         *
         * Blank lines and lines starting with '#' are skipped. An empty
         * optional field means "absent".
         *
         * Only the syntax is checked here (field count, numbers, dates).
         * Cross-record rules such as unique ids or the quality range belong
         * to Analysis::SnapshotValidator.
         */
        class JournalParser
        {
        public:
            using Record = std::variant<core::DreamRecord, core::DailyLog, core::TechniquePractice>;

            /// Control level recorded for "full" without an explicit ":level".
            static constexpr int kDefaultControlLevel = 3;
            static constexpr int kMinControlLevel     = 1;
            static constexpr int kMaxControlLevel     = 5;

            struct ParseResult
            {
                std::optional<Record> record;
                bool skipped = false;     // blank or comment line
                std::string error;        // set when the line is malformed
            };

            struct LineError
            {
                std::size_t line = 0;
                std::string message;
            };

            struct LoadResult
            {
                bool opened = false;
                core::JournalSnapshot snapshot;
                std::vector<LineError> errors;
                std::size_t linesRead = 0;

                bool ok() const noexcept { return opened && errors.empty(); }
            };

            JournalParser() = default;

            ParseResult parseLine(std::string_view rawLine) const;

            /// Read every remaining line of reader; records keep file order.
            LoadResult load(FileReader &reader) const;

            LoadResult loadFile(const std::string &path) const;

        private:
            static std::optional<core::DreamRecord> parseDream(const std::vector<std::string> &fields,
                                                               std::string &error);
            static std::optional<core::DailyLog> parseDailyLog(const std::vector<std::string> &fields,
                                                               std::string &error);
            static std::optional<core::TechniquePractice> parsePractice(const std::vector<std::string> &fields,
                                                                        std::string &error);
        };

    } // namespace Input
} // namespace LucidLog
