#include "analysis/RealityCheckAggregator.hpp"

#include <string>

#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        core::RealityCheckStats RealityCheckAggregator::aggregate(const std::vector<core::DailyLog> &logs) const
        {
            core::RealityCheckStats stats{};
            stats.loggedDays = logs.size();

            for (const auto &log : logs)
            {
                const core::DayCount day{log.date(), log.realityChecks()};
                stats.total += day.count;

                // Strict comparisons plus the date check keep the earliest date on ties,
                // independent of input order.
                auto &most = stats.mostActiveDay;
                if (!most || day.count > most->count ||
                    (day.count == most->count && day.date < most->date))
                {
                    most = day;
                }

                auto &least = stats.leastActiveDay;
                if (!least || day.count < least->count ||
                    (day.count == least->count && day.date < least->date))
                {
                    least = day;
                }
            }

            if (stats.loggedDays > 0)
            {
                stats.averagePerDay =
                    static_cast<double>(stats.total) / static_cast<double>(stats.loggedDays);

                Utils::getLogger().debug(
                    "RealityChecks: total " + std::to_string(stats.total) +
                    " over " + std::to_string(stats.loggedDays) + " days, most active " +
                    Utils::formatDate(stats.mostActiveDay->date));
            }

            return stats;
        }

    } // namespace Analysis
} // namespace LucidLog
