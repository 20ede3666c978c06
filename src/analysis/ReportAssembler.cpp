#include "analysis/ReportAssembler.hpp"

#include <string>
#include <utility>

#include "analysis/CalendarRenderer.hpp"
#include "analysis/DreamStatistics.hpp"
#include "analysis/RealityCheckAggregator.hpp"
#include "analysis/SleepStatistics.hpp"
#include "analysis/SnapshotValidator.hpp"
#include "analysis/TechniqueEffectiveness.hpp"
#include "analysis/TextAnalyzer.hpp"
#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        ReportAssembler::AssemblyResult ReportAssembler::assemble(const core::JournalSnapshot &snapshot,
                                                                  const ReportConfig &config) const
        {
            auto &logger = Utils::getLogger();
            AssemblyResult result;

            if (auto error = validateConfig(config))
            {
                logger.error("Report request rejected: " + error->describe());
                result.error = std::move(error);
                return result;
            }

            if (auto error = SnapshotValidator{}.validate(snapshot))
            {
                logger.error("Journal snapshot rejected: " + error->describe());
                result.error = std::move(error);
                return result;
            }

            const Utils::TimePoint started = Utils::now();
            Utils::TimePoint finished = started;
            core::StatisticsReport report;
            {
                Utils::ScopedTimer timer(finished);

                const TextAnalyzer text(config.stopWords,
                                        static_cast<std::size_t>(config.minWordLength));
                report.setTopWords(text.rankWords(snapshot.dreams,
                                                  static_cast<std::size_t>(config.topWords),
                                                  config.includeTitles));

                DreamStatisticsCalculator dreams;
                report.setDreamStats(dreams.compute(snapshot.dreams));
                report.setWeeklySummary(dreams.weeklySummary(snapshot.dreams, config.referenceDate));

                report.setSleepStats(SleepStatisticsCalculator{}.compute(snapshot.dailyLogs, snapshot.dreams));
                report.setRealityChecks(RealityCheckAggregator{}.aggregate(snapshot.dailyLogs));
                report.setCalendar(CalendarRenderer{}.render(config.calendarMonth, snapshot.dreams));
                report.setTechniques(TechniqueEffectivenessAnalyzer{}.analyze(snapshot.practices));
            }

            logger.info("Report assembled: " + std::to_string(snapshot.dreams.size()) + " dreams, " +
                        std::to_string(snapshot.dailyLogs.size()) + " daily logs, " +
                        std::to_string(snapshot.practices.size()) + " practice sessions in " +
                        std::to_string(Utils::diffMillis(started, finished)) + " ms");

            result.report = std::move(report);
            return result;
        }

    } // namespace Analysis
} // namespace LucidLog
