// File: include/core/JournalSnapshot.hpp
//
// Point-in-time copy of everything the analysis engine reads.

#ifndef LUCIDLOG_CORE_JOURNAL_SNAPSHOT_HPP
#define LUCIDLOG_CORE_JOURNAL_SNAPSHOT_HPP

#include <vector>

#include "core/DailyLog.hpp"
#include "core/DreamRecord.hpp"
#include "core/TechniquePractice.hpp"

namespace core
{

/**
 * @brief Immutable input of one report computation.
 *
 * The loader captures a consistent snapshot before handing it over; every
 * calculator in a single report then reads the same instance by const
 * reference, so no component ever observes a different point in time.
 */
struct JournalSnapshot
{
    std::vector<DreamRecord>       dreams;
    std::vector<DailyLog>          dailyLogs;
    std::vector<TechniquePractice> practices;

    bool empty() const noexcept
    {
        return dreams.empty() && dailyLogs.empty() && practices.empty();
    }
};

} // namespace core

#endif // LUCIDLOG_CORE_JOURNAL_SNAPSHOT_HPP
