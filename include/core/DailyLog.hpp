// File: include/core/DailyLog.hpp
//
// Core data model for the once-a-day sleep and practice log.

#ifndef LUCIDLOG_CORE_DAILY_LOG_HPP
#define LUCIDLOG_CORE_DAILY_LOG_HPP

#include <optional>
#include <string>
#include <vector>

#include "core/Calendar.hpp"
#include "core/DreamRecord.hpp"

namespace core
{

/**
 * @brief Sleep and reality-check data for one calendar date.
 *
 * The date is the unique key of a log within a snapshot. Wake time may be
 * earlier than bedtime (sleep crossing midnight); duration is therefore
 * computed modulo 24h by the sleep statistics calculator.
 *
 * dreamIds is a back-reference only: the dreams themselves belong to the
 * snapshot's dream collection.
 */
class DailyLog
{
public:
    DailyLog() = default;

    DailyLog(Date date,
             TimeOfDay bedtime,
             TimeOfDay wakeTime,
             int sleepQuality,
             int realityChecks,
             std::optional<std::string> wakeFeeling = std::nullopt,
             std::optional<std::string> note = std::nullopt,
             std::vector<DreamRecord::Id> dreamIds = {})
        : m_date(date),
          m_bedtime(bedtime),
          m_wakeTime(wakeTime),
          m_sleepQuality(sleepQuality),
          m_realityChecks(realityChecks),
          m_wakeFeeling(std::move(wakeFeeling)),
          m_note(std::move(note)),
          m_dreamIds(std::move(dreamIds))
    {
    }

    const Date& date() const noexcept { return m_date; }
    const TimeOfDay& bedtime() const noexcept { return m_bedtime; }
    const TimeOfDay& wakeTime() const noexcept { return m_wakeTime; }

    /// Self-rated sleep quality, 1 (poor) to 5 (excellent).
    int sleepQuality() const noexcept { return m_sleepQuality; }

    /// Number of reality checks performed during the day.
    int realityChecks() const noexcept { return m_realityChecks; }

    const std::optional<std::string>& wakeFeeling() const noexcept { return m_wakeFeeling; }
    const std::optional<std::string>& note() const noexcept { return m_note; }
    const std::vector<DreamRecord::Id>& dreamIds() const noexcept { return m_dreamIds; }

private:
    Date                         m_date{};
    TimeOfDay                    m_bedtime{};
    TimeOfDay                    m_wakeTime{};
    int                          m_sleepQuality{0};
    int                          m_realityChecks{0};
    std::optional<std::string>   m_wakeFeeling;
    std::optional<std::string>   m_note;
    std::vector<DreamRecord::Id> m_dreamIds;
};

} // namespace core

#endif // LUCIDLOG_CORE_DAILY_LOG_HPP
