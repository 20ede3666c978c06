// File: include/core/StatisticsReport.hpp
//
// Core data model for the outcome of one analytics run.
// Produced by the report assembler and consumed by the reporters
// (console, JSON). Contains only derived values; it never references the
// snapshot it was computed from.

#ifndef LUCIDLOG_CORE_STATISTICS_REPORT_HPP
#define LUCIDLOG_CORE_STATISTICS_REPORT_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/Calendar.hpp"

namespace core
{

/// One entry of a frequency ranking (words, dream signs).
struct WordCount
{
    std::string word;
    std::size_t count{0};
};

inline bool operator==(const WordCount& a, const WordCount& b) noexcept
{
    return a.count == b.count && a.word == b.word;
}

/**
 * @brief Totals and groupings over the dream collection.
 */
struct DreamStats
{
    std::size_t totalDreams{0};
    std::size_t lucidDreams{0};
    double      lucidPercentage{0.0};               ///< 0 when totalDreams == 0.
    std::optional<double> averageWordCount;          ///< No data when empty.

    std::map<Date, std::size_t>      dreamsByDay;
    std::map<IsoWeek, std::size_t>   dreamsByWeek;
    std::map<YearMonth, std::size_t> dreamsByMonth;

    std::vector<WordCount> commonDreamSigns;         ///< Lucid dreams only.
};

/**
 * @brief Seven-day window ending at (and including) a reference date.
 */
struct WeeklySummary
{
    Date        from{};
    Date        to{};
    std::size_t dreams{0};
    std::size_t lucidDreams{0};
    double      dreamsPerDay{0.0};
    std::optional<double> averageWordCount;
};

/// One row of the sleep-quality vs lucidity table.
struct QualityBucket
{
    int         quality{0};          ///< 1..5
    std::size_t dreamDays{0};        ///< Logged dates with at least one dream.
    std::size_t lucidDreamDays{0};   ///< ...of which at least one dream was lucid.
    std::optional<double> lucidityRate; ///< lucidDreamDays / dreamDays; no data when dreamDays == 0.
};

/// Computed sleep length of one logged night.
struct NightDuration
{
    Date   date{};
    double hours{0.0};
};

/**
 * @brief Aggregates over the daily-log collection.
 */
struct SleepStats
{
    std::size_t nightsTracked{0};

    std::optional<double> averageDurationHours;
    std::optional<double> averageQuality;
    std::optional<double> minDurationHours;
    std::optional<double> maxDurationHours;

    std::optional<double> lucidNightPercentage;       ///< Logged nights with a lucid dream, in %.
    std::optional<double> averageQualityOnLucidNights;

    std::vector<NightDuration> durations;             ///< Ordered by date.
    std::vector<QualityBucket> qualityVsLucidity;     ///< Always quality 1..5.
};

/// A date together with the count recorded on it.
struct DayCount
{
    Date date{};
    int  count{0};
};

/**
 * @brief Reality-check totals across logged days.
 */
struct RealityCheckStats
{
    std::int64_t total{0};
    std::size_t  loggedDays{0};

    std::optional<DayCount> mostActiveDay;
    std::optional<DayCount> leastActiveDay;
    std::optional<double>   averagePerDay;
};

/// Tag of one calendar cell. Lucid takes precedence over a plain dream.
enum class DayMark : std::uint8_t
{
    NoEntry = 0,
    DreamLogged,
    LucidDreamLogged
};

inline const char* dayMarkToString(DayMark mark) noexcept
{
    switch (mark)
    {
    case DayMark::NoEntry:          return "none";
    case DayMark::DreamLogged:      return "dream";
    case DayMark::LucidDreamLogged: return "lucid";
    default:                        return "unknown";
    }
}

struct CalendarDay
{
    Date        date{};
    DayMark     mark{DayMark::NoEntry};
    std::size_t dreamCount{0};
};

/// Day-by-day view of one month, without padding cells.
struct CalendarMonth
{
    YearMonth                month{};
    std::vector<CalendarDay> days;
};

enum class TechniqueRecommendation : std::uint8_t
{
    KeepAsPrimary = 0,
    CombineWithAnother,
    ModifyOrSwitch
};

inline const char* recommendationToString(TechniqueRecommendation rec) noexcept
{
    switch (rec)
    {
    case TechniqueRecommendation::KeepAsPrimary:      return "Continue using as primary technique";
    case TechniqueRecommendation::CombineWithAnother: return "Combine with another technique";
    case TechniqueRecommendation::ModifyOrSwitch:     return "Try modifying approach or switch techniques";
    default:                                          return "";
    }
}

struct TechniqueStats
{
    std::string technique;
    std::size_t attempts{0};
    std::size_t successes{0};
    double      successRate{0.0};   ///< Percent.
    Date        lastPracticed{};
    TechniqueRecommendation recommendation{TechniqueRecommendation::ModifyOrSwitch};
};

struct TechniqueSummary
{
    std::vector<TechniqueStats> techniques;   ///< Ordered by technique name.
    std::optional<std::string>  mostEffective;
    std::optional<std::string>  leastEffective;
};

/**
 * @brief Complete result of one analytics run.
 *
 * Responsibilities:
 *  - Bundle every derived metric into a single value.
 *  - Stay independent of any output format (console/JSON).
 *
 * Design notes:
 *  - Value semantics; safe to share read-only across threads.
 *  - Builder-style setters are used by the assembler only.
 */
class StatisticsReport
{
public:
    StatisticsReport() = default;

    StatisticsReport(const StatisticsReport&)            = default;
    StatisticsReport(StatisticsReport&&) noexcept        = default;
    StatisticsReport& operator=(const StatisticsReport&) = default;
    StatisticsReport& operator=(StatisticsReport&&) noexcept = default;

    ~StatisticsReport() = default;

    // ---------- Accessors ----------

    const std::vector<WordCount>& topWords() const noexcept { return m_topWords; }
    const DreamStats& dreamStats() const noexcept { return m_dreamStats; }
    const WeeklySummary& weeklySummary() const noexcept { return m_weeklySummary; }
    const SleepStats& sleepStats() const noexcept { return m_sleepStats; }
    const RealityCheckStats& realityChecks() const noexcept { return m_realityChecks; }
    const CalendarMonth& calendar() const noexcept { return m_calendar; }
    const TechniqueSummary& techniques() const noexcept { return m_techniques; }

    // ---------- Builder-style mutators ----------

    void setTopWords(std::vector<WordCount> words) { m_topWords = std::move(words); }
    void setDreamStats(DreamStats stats) { m_dreamStats = std::move(stats); }
    void setWeeklySummary(WeeklySummary summary) { m_weeklySummary = summary; }
    void setSleepStats(SleepStats stats) { m_sleepStats = std::move(stats); }
    void setRealityChecks(RealityCheckStats stats) { m_realityChecks = stats; }
    void setCalendar(CalendarMonth calendar) { m_calendar = std::move(calendar); }
    void setTechniques(TechniqueSummary summary) { m_techniques = std::move(summary); }

private:
    std::vector<WordCount> m_topWords;
    DreamStats             m_dreamStats;
    WeeklySummary          m_weeklySummary;
    SleepStats             m_sleepStats;
    RealityCheckStats      m_realityChecks;
    CalendarMonth          m_calendar;
    TechniqueSummary       m_techniques;
};

} // namespace core

#endif // LUCIDLOG_CORE_STATISTICS_REPORT_HPP
