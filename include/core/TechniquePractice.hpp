// File: include/core/TechniquePractice.hpp
//
// One recorded practice session of a lucid-dreaming induction technique
// (MILD, WBTB, FILD, reality checks, ...).

#ifndef LUCIDLOG_CORE_TECHNIQUE_PRACTICE_HPP
#define LUCIDLOG_CORE_TECHNIQUE_PRACTICE_HPP

#include <cstdint>
#include <string>

#include "core/Calendar.hpp"

namespace core
{

/**
 * @brief How a practice session ended.
 */
enum class PracticeOutcome : std::uint8_t
{
    Unattempted = 0,
    Failed,
    PartialLucid,
    FullLucid
};

inline const char* practiceOutcomeToString(PracticeOutcome outcome) noexcept
{
    switch (outcome)
    {
    case PracticeOutcome::Unattempted:  return "unattempted";
    case PracticeOutcome::Failed:       return "failed";
    case PracticeOutcome::PartialLucid: return "partial";
    case PracticeOutcome::FullLucid:    return "full";
    default:                            return "unknown";
    }
}

/**
 * @brief A single technique practice entry.
 *
 * controlLevel is only meaningful for PracticeOutcome::FullLucid.
 */
struct TechniquePractice
{
    std::string     technique;
    Date            date{};
    int             durationMinutes{0};
    PracticeOutcome outcome{PracticeOutcome::Unattempted};
    int             controlLevel{0};

    /// Partial and full lucidity both count as a success.
    bool isSuccess() const noexcept
    {
        return outcome == PracticeOutcome::PartialLucid ||
               outcome == PracticeOutcome::FullLucid;
    }
};

} // namespace core

#endif // LUCIDLOG_CORE_TECHNIQUE_PRACTICE_HPP
