#pragma once

#include <optional>

#include "core/AnalysisError.hpp"
#include "core/JournalSnapshot.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * SnapshotValidator
         *
         * Checks the record invariants every calculator relies on and reports
         * the first violation found, walking dreams, then daily logs, then
         * practice sessions, each in snapshot order.
         *
         * Rules (rule names as reported in AnalysisError::rule):
         *  - invalid-created-at       dream timestamp is not a real date/time
         *  - duplicate-dream-id       two dreams share an id
         *  - dream-sign-without-lucid a non-lucid dream carries a dream sign
         *  - lucid-without-dream-sign a lucid dream has no (or a blank) sign
         *  - invalid-log-date         log date is not a real calendar date
         *  - duplicate-log-date       two daily logs share a date
         *  - invalid-sleep-time       bedtime or wake time out of range
         *  - sleep-quality-range      quality outside 1..5
         *  - negative-reality-checks  reality checks below zero
         *  - blank-technique          practice without a technique name
         *  - invalid-practice-date    practice date is not a real date
         *  - negative-duration        practice duration below zero
         *
         * A daily log that references an unknown dream id is tolerated: the
         * reference is only a back-link, and the validator logs a warning.
         */
        class SnapshotValidator
        {
        public:
            SnapshotValidator() = default;

            std::optional<core::AnalysisError> validate(const core::JournalSnapshot &snapshot) const;
        };

    } // namespace Analysis
} // namespace LucidLog
