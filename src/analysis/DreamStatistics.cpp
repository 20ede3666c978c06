#include "analysis/DreamStatistics.hpp"

#include <string>

#include "analysis/TextAnalyzer.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        core::DreamStats DreamStatisticsCalculator::compute(const std::vector<core::DreamRecord> &dreams) const
        {
            core::DreamStats stats{};
            stats.totalDreams = dreams.size();

            std::size_t totalWords = 0;
            for (const auto &dream : dreams)
            {
                if (dream.isLucid())
                    ++stats.lucidDreams;

                const core::Date &day = dream.date();
                ++stats.dreamsByDay[day];
                ++stats.dreamsByWeek[Utils::isoWeekOf(day)];
                ++stats.dreamsByMonth[Utils::yearMonthOf(day)];

                totalWords += TextAnalyzer::countWords(dream.content());
            }

            stats.lucidPercentage = lucidPercentage(stats.lucidDreams, stats.totalDreams);

            if (!dreams.empty())
            {
                stats.averageWordCount =
                    static_cast<double>(totalWords) / static_cast<double>(dreams.size());
            }

            stats.commonDreamSigns = rankDreamSigns(dreams);

            Utils::getLogger().debug(
                "DreamStatistics: " + std::to_string(stats.totalDreams) + " dreams, " +
                std::to_string(stats.lucidDreams) + " lucid, " +
                std::to_string(stats.dreamsByDay.size()) + " distinct days");

            return stats;
        }

        core::WeeklySummary DreamStatisticsCalculator::weeklySummary(const std::vector<core::DreamRecord> &dreams,
                                                                     const core::Date &reference) const
        {
            core::WeeklySummary summary{};
            summary.to   = reference;
            summary.from = Utils::addDays(reference, -(kWeekLength - 1));

            std::size_t totalWords = 0;
            for (const auto &dream : dreams)
            {
                const core::Date &day = dream.date();
                if (day < summary.from || day > summary.to)
                    continue;

                ++summary.dreams;
                if (dream.isLucid())
                    ++summary.lucidDreams;
                totalWords += TextAnalyzer::countWords(dream.content());
            }

            summary.dreamsPerDay = static_cast<double>(summary.dreams) / kWeekLength;
            if (summary.dreams > 0)
            {
                summary.averageWordCount =
                    static_cast<double>(totalWords) / static_cast<double>(summary.dreams);
            }

            return summary;
        }

        double DreamStatisticsCalculator::lucidPercentage(std::size_t lucid, std::size_t total) noexcept
        {
            if (total == 0)
                return 0.0;
            return static_cast<double>(lucid) / static_cast<double>(total) * 100.0;
        }

        std::vector<core::WordCount> DreamStatisticsCalculator::rankDreamSigns(const std::vector<core::DreamRecord> &dreams)
        {
            std::vector<std::string> signs;
            for (const auto &dream : dreams)
            {
                if (!dream.isLucid() || !dream.dreamSign())
                    continue;

                std::string sign = Utils::toLower(Utils::trim(*dream.dreamSign()));
                if (!sign.empty())
                    signs.push_back(std::move(sign));
            }

            return TextAnalyzer::rankByFrequency(signs, 0);
        }

    } // namespace Analysis
} // namespace LucidLog
