#include "analysis/SnapshotValidator.hpp"

#include <set>
#include <string>

#include "analysis/SleepStatistics.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        namespace
        {
            std::string dreamSubject(core::DreamRecord::Id id)
            {
                return "dream #" + std::to_string(id);
            }

            std::string logSubject(const core::Date &date)
            {
                return "log " + Utils::formatDate(date);
            }

            std::string practiceSubject(std::size_t index)
            {
                return "practice #" + std::to_string(index + 1);
            }

            std::optional<core::AnalysisError> checkDreams(const std::vector<core::DreamRecord> &dreams,
                                                           std::set<core::DreamRecord::Id> &ids)
            {
                for (const auto &dream : dreams)
                {
                    const std::string subject = dreamSubject(dream.id());

                    if (!Utils::isValidDate(dream.created().date) ||
                        !Utils::isValidTime(dream.created().time))
                    {
                        return core::malformedInput("invalid-created-at", subject,
                                                    "creation timestamp is not a valid date and time");
                    }

                    if (!ids.insert(dream.id()).second)
                    {
                        return core::malformedInput("duplicate-dream-id", subject,
                                                    "id is used by more than one dream");
                    }

                    const auto &sign = dream.dreamSign();
                    const bool hasSign = sign.has_value() && !Utils::trim(*sign).empty();
                    if (!dream.isLucid() && sign.has_value())
                    {
                        return core::malformedInput("dream-sign-without-lucid", subject,
                                                    "only lucid dreams may record a dream sign");
                    }
                    if (dream.isLucid() && !hasSign)
                    {
                        return core::malformedInput("lucid-without-dream-sign", subject,
                                                    "lucid dreams must record a dream sign");
                    }
                }
                return std::nullopt;
            }

            std::optional<core::AnalysisError> checkLogs(const std::vector<core::DailyLog> &logs,
                                                         const std::set<core::DreamRecord::Id> &ids)
            {
                std::set<core::Date> dates;
                for (const auto &log : logs)
                {
                    const std::string subject = logSubject(log.date());

                    if (!Utils::isValidDate(log.date()))
                    {
                        return core::malformedInput("invalid-log-date", subject,
                                                    "not a valid calendar date");
                    }
                    if (!dates.insert(log.date()).second)
                    {
                        return core::malformedInput("duplicate-log-date", subject,
                                                    "more than one daily log for this date");
                    }
                    if (!Utils::isValidTime(log.bedtime()) || !Utils::isValidTime(log.wakeTime()))
                    {
                        return core::malformedInput("invalid-sleep-time", subject,
                                                    "bedtime and wake time must be within 00:00..23:59");
                    }
                    if (log.sleepQuality() < SleepStatisticsCalculator::kMinQuality ||
                        log.sleepQuality() > SleepStatisticsCalculator::kMaxQuality)
                    {
                        return core::malformedInput("sleep-quality-range", subject,
                                                    "sleep quality " + std::to_string(log.sleepQuality()) +
                                                        " is outside 1..5");
                    }
                    if (log.realityChecks() < 0)
                    {
                        return core::malformedInput("negative-reality-checks", subject,
                                                    "reality check count " +
                                                        std::to_string(log.realityChecks()) + " is negative");
                    }

                    for (const auto id : log.dreamIds())
                    {
                        if (ids.find(id) == ids.end())
                        {
                            Utils::getLogger().warn("SnapshotValidator: " + subject +
                                                    " references unknown " + dreamSubject(id));
                        }
                    }
                }
                return std::nullopt;
            }

            std::optional<core::AnalysisError> checkPractices(const std::vector<core::TechniquePractice> &practices)
            {
                for (std::size_t i = 0; i < practices.size(); ++i)
                {
                    const auto &practice = practices[i];
                    const std::string subject = practiceSubject(i);

                    if (Utils::trim(practice.technique).empty())
                    {
                        return core::malformedInput("blank-technique", subject,
                                                    "technique name is empty");
                    }
                    if (!Utils::isValidDate(practice.date))
                    {
                        return core::malformedInput("invalid-practice-date", subject,
                                                    "not a valid calendar date");
                    }
                    if (practice.durationMinutes < 0)
                    {
                        return core::malformedInput("negative-duration", subject,
                                                    "duration " + std::to_string(practice.durationMinutes) +
                                                        " minutes is negative");
                    }
                }
                return std::nullopt;
            }
        } // anonymous namespace

        std::optional<core::AnalysisError> SnapshotValidator::validate(const core::JournalSnapshot &snapshot) const
        {
            std::set<core::DreamRecord::Id> ids;

            if (auto error = checkDreams(snapshot.dreams, ids))
                return error;
            if (auto error = checkLogs(snapshot.dailyLogs, ids))
                return error;
            if (auto error = checkPractices(snapshot.practices))
                return error;

            return std::nullopt;
        }

    } // namespace Analysis
} // namespace LucidLog
