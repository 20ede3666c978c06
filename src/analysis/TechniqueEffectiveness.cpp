#include "analysis/TechniqueEffectiveness.hpp"

#include <map>
#include <string>

#include "utils/Logger.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        core::TechniqueRecommendation TechniqueEffectivenessAnalyzer::recommend(double successRate) noexcept
        {
            if (successRate > kPrimaryThreshold)
                return core::TechniqueRecommendation::KeepAsPrimary;
            if (successRate > kCombineThreshold)
                return core::TechniqueRecommendation::CombineWithAnother;
            return core::TechniqueRecommendation::ModifyOrSwitch;
        }

        core::TechniqueSummary TechniqueEffectivenessAnalyzer::analyze(const std::vector<core::TechniquePractice> &practices) const
        {
            std::map<std::string, core::TechniqueStats> byName;

            for (const auto &practice : practices)
            {
                auto [it, inserted] = byName.try_emplace(practice.technique);
                auto &stats = it->second;
                if (inserted)
                {
                    stats.technique     = practice.technique;
                    stats.lastPracticed = practice.date;
                }

                ++stats.attempts;
                if (practice.isSuccess())
                    ++stats.successes;
                if (stats.lastPracticed < practice.date)
                    stats.lastPracticed = practice.date;
            }

            core::TechniqueSummary summary{};
            summary.techniques.reserve(byName.size());

            const core::TechniqueStats *best  = nullptr;
            const core::TechniqueStats *worst = nullptr;

            for (auto &[name, stats] : byName)
            {
                stats.successRate = stats.attempts == 0
                                        ? 0.0
                                        : static_cast<double>(stats.successes) /
                                              static_cast<double>(stats.attempts) * 100.0;
                stats.recommendation = recommend(stats.successRate);
                summary.techniques.push_back(stats);
            }

            // Name order is already the map order, so strict comparisons keep the
            // alphabetically first technique on ties.
            for (const auto &stats : summary.techniques)
            {
                if (!best || stats.successRate > best->successRate)
                    best = &stats;
                if (!worst || stats.successRate < worst->successRate)
                    worst = &stats;
            }

            if (summary.techniques.size() >= 2)
            {
                summary.mostEffective  = best->technique;
                summary.leastEffective = worst->technique;
            }

            Utils::getLogger().debug(
                "TechniqueEffectiveness: " + std::to_string(practices.size()) + " sessions across " +
                std::to_string(summary.techniques.size()) + " techniques");

            return summary;
        }

    } // namespace Analysis
} // namespace LucidLog
