#include "report/JsonReporter.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
namespace Report
{
    namespace
    {
        std::string jsonQuoted(std::string_view s)
        {
            return "\"" + Utils::escapeJson(s) + "\"";
        }

        std::string optionalNumber(const std::optional<double> &value)
        {
            return value ? JsonReporter::formatNumber(*value) : "null";
        }

        std::string optionalString(const std::optional<std::string> &value)
        {
            return value ? jsonQuoted(*value) : "null";
        }

        std::string dayCountToJson(const std::optional<core::DayCount> &day)
        {
            if (!day)
                return "null";
            return "{\"date\":" + jsonQuoted(Utils::formatDate(day->date)) +
                   ",\"count\":" + std::to_string(day->count) + "}";
        }

        // Object of "key": count pairs; keys are formatted by fmt in map order.
        template <typename Map, typename Format>
        std::string countsToJson(const Map &counts, Format fmt)
        {
            std::ostringstream oss;
            oss << "{";
            bool first = true;
            for (const auto &[key, count] : counts)
            {
                if (!first) oss << ",";
                first = false;
                oss << jsonQuoted(fmt(key)) << ":" << count;
            }
            oss << "}";
            return oss.str();
        }
    } // namespace

    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty)
    {
    }

    void JsonReporter::generateReport(const core::StatisticsReport &report)
    {
        m_report = report;
        Utils::getLogger().debug("JsonReporter: report prepared (" +
                                 std::to_string(report.dreamStats().totalDreams) + " dreams)");
    }

    void JsonReporter::setSearchResult(std::string keyword, std::vector<core::DreamRecord::Id> matches)
    {
        m_search = SearchResult{std::move(keyword), std::move(matches)};
    }

    std::string JsonReporter::formatNumber(double value)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4) << value;
        return oss.str();
    }

    std::string JsonReporter::wordCountsToJson(const std::vector<core::WordCount> &words)
    {
        std::ostringstream oss;
        oss << "[";
        for (std::size_t i = 0; i < words.size(); ++i)
        {
            if (i) oss << ",";
            oss << "{\"word\":" << jsonQuoted(words[i].word) << ",\"count\":" << words[i].count << "}";
        }
        oss << "]";
        return oss.str();
    }

    std::string JsonReporter::dreamStatsToJson(const core::DreamStats &stats)
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"total\":" << stats.totalDreams << ",";
        oss << "\"lucid\":" << stats.lucidDreams << ",";
        oss << "\"lucidPercentage\":" << formatNumber(stats.lucidPercentage) << ",";
        oss << "\"averageWordCount\":" << optionalNumber(stats.averageWordCount) << ",";
        oss << "\"byDay\":" << countsToJson(stats.dreamsByDay, Utils::formatDate) << ",";
        oss << "\"byWeek\":" << countsToJson(stats.dreamsByWeek, Utils::formatIsoWeek) << ",";
        oss << "\"byMonth\":" << countsToJson(stats.dreamsByMonth, Utils::formatYearMonth) << ",";
        oss << "\"dreamSigns\":" << wordCountsToJson(stats.commonDreamSigns);
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::weeklySummaryToJson(const core::WeeklySummary &summary)
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"from\":" << jsonQuoted(Utils::formatDate(summary.from)) << ",";
        oss << "\"to\":" << jsonQuoted(Utils::formatDate(summary.to)) << ",";
        oss << "\"dreams\":" << summary.dreams << ",";
        oss << "\"lucidDreams\":" << summary.lucidDreams << ",";
        oss << "\"dreamsPerDay\":" << formatNumber(summary.dreamsPerDay) << ",";
        oss << "\"averageWordCount\":" << optionalNumber(summary.averageWordCount);
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::sleepStatsToJson(const core::SleepStats &stats)
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"nightsTracked\":" << stats.nightsTracked << ",";
        oss << "\"averageDurationHours\":" << optionalNumber(stats.averageDurationHours) << ",";
        oss << "\"averageQuality\":" << optionalNumber(stats.averageQuality) << ",";
        oss << "\"minDurationHours\":" << optionalNumber(stats.minDurationHours) << ",";
        oss << "\"maxDurationHours\":" << optionalNumber(stats.maxDurationHours) << ",";
        oss << "\"lucidNightPercentage\":" << optionalNumber(stats.lucidNightPercentage) << ",";
        oss << "\"averageQualityOnLucidNights\":" << optionalNumber(stats.averageQualityOnLucidNights) << ",";

        oss << "\"durations\":[";
        for (std::size_t i = 0; i < stats.durations.size(); ++i)
        {
            if (i) oss << ",";
            oss << "{\"date\":" << jsonQuoted(Utils::formatDate(stats.durations[i].date))
                << ",\"hours\":" << formatNumber(stats.durations[i].hours) << "}";
        }
        oss << "],";

        oss << "\"qualityVsLucidity\":[";
        for (std::size_t i = 0; i < stats.qualityVsLucidity.size(); ++i)
        {
            const auto &bucket = stats.qualityVsLucidity[i];
            if (i) oss << ",";
            oss << "{\"quality\":" << bucket.quality
                << ",\"dreamDays\":" << bucket.dreamDays
                << ",\"lucidDreamDays\":" << bucket.lucidDreamDays
                << ",\"lucidityRate\":" << optionalNumber(bucket.lucidityRate) << "}";
        }
        oss << "]";

        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::realityChecksToJson(const core::RealityCheckStats &stats)
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"total\":" << stats.total << ",";
        oss << "\"loggedDays\":" << stats.loggedDays << ",";
        oss << "\"mostActiveDay\":" << dayCountToJson(stats.mostActiveDay) << ",";
        oss << "\"leastActiveDay\":" << dayCountToJson(stats.leastActiveDay) << ",";
        oss << "\"averagePerDay\":" << optionalNumber(stats.averagePerDay);
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::calendarToJson(const core::CalendarMonth &calendar)
    {
        std::ostringstream oss;
        oss << "{\"month\":" << jsonQuoted(Utils::formatYearMonth(calendar.month)) << ",\"days\":[";
        for (std::size_t i = 0; i < calendar.days.size(); ++i)
        {
            const auto &day = calendar.days[i];
            if (i) oss << ",";
            oss << "{\"date\":" << jsonQuoted(Utils::formatDate(day.date))
                << ",\"mark\":" << jsonQuoted(core::dayMarkToString(day.mark))
                << ",\"dreams\":" << day.dreamCount << "}";
        }
        oss << "]}";
        return oss.str();
    }

    std::string JsonReporter::techniquesToJson(const core::TechniqueSummary &summary)
    {
        std::ostringstream oss;
        oss << "{\"techniques\":[";
        for (std::size_t i = 0; i < summary.techniques.size(); ++i)
        {
            const auto &t = summary.techniques[i];
            if (i) oss << ",";
            oss << "{\"technique\":" << jsonQuoted(t.technique)
                << ",\"attempts\":" << t.attempts
                << ",\"successes\":" << t.successes
                << ",\"successRate\":" << formatNumber(t.successRate)
                << ",\"lastPracticed\":" << jsonQuoted(Utils::formatDate(t.lastPracticed))
                << ",\"recommendation\":" << jsonQuoted(core::recommendationToString(t.recommendation)) << "}";
        }
        oss << "],";
        oss << "\"mostEffective\":" << optionalString(summary.mostEffective) << ",";
        oss << "\"leastEffective\":" << optionalString(summary.leastEffective);
        oss << "}";
        return oss.str();
    }

    std::vector<std::pair<std::string, std::string>> JsonReporter::sections() const
    {
        std::vector<std::pair<std::string, std::string>> out;
        out.emplace_back("topWords", wordCountsToJson(m_report.topWords()));
        out.emplace_back("dreams", dreamStatsToJson(m_report.dreamStats()));
        out.emplace_back("weeklySummary", weeklySummaryToJson(m_report.weeklySummary()));
        out.emplace_back("sleep", sleepStatsToJson(m_report.sleepStats()));
        out.emplace_back("realityChecks", realityChecksToJson(m_report.realityChecks()));
        out.emplace_back("calendar", calendarToJson(m_report.calendar()));
        out.emplace_back("techniques", techniquesToJson(m_report.techniques()));

        if (m_search)
        {
            std::ostringstream oss;
            oss << "{\"keyword\":" << jsonQuoted(m_search->keyword) << ",\"matches\":[";
            for (std::size_t i = 0; i < m_search->matches.size(); ++i)
            {
                if (i) oss << ",";
                oss << m_search->matches[i];
            }
            oss << "]}";
            out.emplace_back("search", oss.str());
        }
        return out;
    }

    void JsonReporter::writeJson(std::ostream &output) const
    {
        const auto parts = sections();
        const bool pretty = m_prettyPrint == PrettyPrint::PRETTY;

        output << (pretty ? "{\n" : "{");
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            if (pretty)
                output << "  " << jsonQuoted(parts[i].first) << ": " << parts[i].second;
            else
                output << jsonQuoted(parts[i].first) << ":" << parts[i].second;

            if (i + 1 < parts.size())
                output << ",";
            if (pretty)
                output << "\n";
        }
        output << (pretty ? "}\n" : "}");
    }

    std::string JsonReporter::getJsonString() const
    {
        std::ostringstream oss;
        writeJson(oss);
        return oss.str();
    }

} // namespace Report
} // namespace LucidLog
