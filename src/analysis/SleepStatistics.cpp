#include "analysis/SleepStatistics.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <string>

#include "utils/Logger.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        namespace
        {
            // Every date with at least one dream -> whether any of them was lucid.
            std::map<core::Date, bool> lucidityByDay(const std::vector<core::DreamRecord> &dreams)
            {
                std::map<core::Date, bool> days;
                for (const auto &dream : dreams)
                {
                    bool &lucid = days[dream.date()];
                    lucid = lucid || dream.isLucid();
                }
                return days;
            }
        } // anonymous namespace

        int SleepStatisticsCalculator::durationMinutes(const core::TimeOfDay &bedtime,
                                                       const core::TimeOfDay &wakeTime) noexcept
        {
            const int diff = wakeTime.minutesSinceMidnight() - bedtime.minutesSinceMidnight();
            return ((diff % kMinutesPerDay) + kMinutesPerDay) % kMinutesPerDay;
        }

        double SleepStatisticsCalculator::durationHours(const core::TimeOfDay &bedtime,
                                                        const core::TimeOfDay &wakeTime) noexcept
        {
            return static_cast<double>(durationMinutes(bedtime, wakeTime)) / 60.0;
        }

        core::SleepStats SleepStatisticsCalculator::compute(const std::vector<core::DailyLog> &logs,
                                                            const std::vector<core::DreamRecord> &dreams) const
        {
            core::SleepStats stats{};
            stats.nightsTracked     = logs.size();
            stats.qualityVsLucidity = qualityVsLucidity(logs, dreams);

            if (logs.empty())
            {
                Utils::getLogger().debug("SleepStatistics: no daily logs");
                return stats;
            }

            std::vector<const core::DailyLog *> byDate;
            byDate.reserve(logs.size());
            for (const auto &log : logs)
                byDate.push_back(&log);
            std::sort(byDate.begin(), byDate.end(),
                      [](const core::DailyLog *a, const core::DailyLog *b) { return a->date() < b->date(); });

            const auto days = lucidityByDay(dreams);

            std::int64_t totalMinutes = 0;
            std::int64_t totalQuality = 0;
            int minMinutes = kMinutesPerDay;
            int maxMinutes = 0;
            std::size_t lucidNights = 0;
            std::int64_t lucidQuality = 0;

            for (const core::DailyLog *log : byDate)
            {
                const int minutes = durationMinutes(log->bedtime(), log->wakeTime());
                totalMinutes += minutes;
                totalQuality += log->sleepQuality();
                minMinutes = std::min(minMinutes, minutes);
                maxMinutes = std::max(maxMinutes, minutes);

                stats.durations.push_back(core::NightDuration{log->date(), minutes / 60.0});

                auto it = days.find(log->date());
                if (it != days.end() && it->second)
                {
                    ++lucidNights;
                    lucidQuality += log->sleepQuality();
                }
            }

            const double n = static_cast<double>(logs.size());
            stats.averageDurationHours = static_cast<double>(totalMinutes) / 60.0 / n;
            stats.averageQuality       = static_cast<double>(totalQuality) / n;
            stats.minDurationHours     = minMinutes / 60.0;
            stats.maxDurationHours     = maxMinutes / 60.0;
            stats.lucidNightPercentage = static_cast<double>(lucidNights) / n * 100.0;

            if (lucidNights > 0)
            {
                stats.averageQualityOnLucidNights =
                    static_cast<double>(lucidQuality) / static_cast<double>(lucidNights);
            }

            Utils::getLogger().debug(
                "SleepStatistics: " + std::to_string(logs.size()) + " nights, " +
                std::to_string(lucidNights) + " with a lucid dream");

            return stats;
        }

        std::vector<core::QualityBucket> SleepStatisticsCalculator::qualityVsLucidity(const std::vector<core::DailyLog> &logs,
                                                                                     const std::vector<core::DreamRecord> &dreams)
        {
            std::vector<core::QualityBucket> buckets;
            for (int q = kMinQuality; q <= kMaxQuality; ++q)
            {
                core::QualityBucket bucket{};
                bucket.quality = q;
                buckets.push_back(bucket);
            }

            const auto days = lucidityByDay(dreams);
            for (const auto &log : logs)
            {
                const int q = log.sleepQuality();
                if (q < kMinQuality || q > kMaxQuality)
                    continue;

                auto it = days.find(log.date());
                if (it == days.end())
                    continue;

                auto &bucket = buckets[static_cast<std::size_t>(q - kMinQuality)];
                ++bucket.dreamDays;
                if (it->second)
                    ++bucket.lucidDreamDays;
            }

            for (auto &bucket : buckets)
            {
                if (bucket.dreamDays > 0)
                {
                    bucket.lucidityRate = static_cast<double>(bucket.lucidDreamDays) /
                                          static_cast<double>(bucket.dreamDays);
                }
            }

            return buckets;
        }

    } // namespace Analysis
} // namespace LucidLog
