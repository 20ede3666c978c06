#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/AnalysisError.hpp"
#include "core/DreamRecord.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * DreamSearch
         *
         * Case-insensitive substring search over title, content and tags.
         */
        class DreamSearch
        {
        public:
            struct Result
            {
                std::vector<core::DreamRecord::Id> matches;   ///< Snapshot order.
                std::optional<core::AnalysisError> error;
            };

            DreamSearch() = default;

            /// A blank keyword is a configuration error.
            Result search(const std::vector<core::DreamRecord> &dreams,
                          const std::string &keyword) const;

            static bool matches(const core::DreamRecord &dream, const std::string &keyword);
        };

    } // namespace Analysis
} // namespace LucidLog
