#include "report/ConsoleReporter.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>

#include "utils/TimeUtils.hpp"

#if defined(_WIN32)
  #include <io.h>      // _isatty, _fileno
#else
  #include <unistd.h>  // isatty, fileno
#endif

namespace LucidLog
{
namespace Report
{
    namespace
    {
        constexpr const char *kReset  = "\033[0m";
        constexpr const char *kBold   = "\033[1m";
        constexpr const char *kCyan   = "\033[96m";
        constexpr const char *kGreen  = "\033[92m";
        constexpr const char *kYellow = "\033[93m";
        constexpr const char *kDim    = "\033[2m";

        // Longest night drawn as a full bar.
        constexpr double kBarHours = 12.0;
        constexpr int    kBarWidth = 24;

        bool stdoutIsTty() noexcept
        {
        #if defined(_WIN32)
            return _isatty(_fileno(stdout)) != 0;
        #else
            return ::isatty(::fileno(stdout)) != 0;
        #endif
        }

        std::string fixed(double value, int precision)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(precision) << value;
            return oss.str();
        }
    } // namespace

    ConsoleReporter::ConsoleReporter(Verbosity verbosity, std::ostream &output)
        : m_verbosity(verbosity),
          m_colorsEnabled(&output == &std::cout && stdoutIsTty()),
          m_output(&output)
    {
    }

    void ConsoleReporter::generateReport(const core::StatisticsReport &report)
    {
        auto &os = *m_output;
        os << "\n" << color(kBold) << "=== DREAM JOURNAL REPORT ===" << color(kReset) << "\n";

        if (m_verbosity == Verbosity::QUIET)
        {
            const auto &d = report.dreamStats();
            os << "Dreams: " << d.totalDreams << " (" << d.lucidDreams << " lucid, "
               << fixed(d.lucidPercentage, 1) << "%), nights tracked: "
               << report.sleepStats().nightsTracked << "\n";
            flush();
            return;
        }

        printDreamStats(report.dreamStats());
        printWordRanking("Most Common Words", report.topWords());
        printWordRanking("Dream Signs", report.dreamStats().commonDreamSigns);
        printWeeklySummary(report.weeklySummary());
        printSleepStats(report.sleepStats());
        printRealityChecks(report.realityChecks());
        printCalendar(report.calendar());
        printTechniques(report.techniques());

        os << "=== END REPORT ===\n\n";
        flush();
    }

    void ConsoleReporter::printSearchResult(const std::string &keyword,
                                            const std::vector<core::DreamRecord::Id> &matches,
                                            const std::vector<core::DreamRecord> &dreams)
    {
        auto &os = *m_output;
        printHeading("Search: \"" + keyword + "\"");

        if (matches.empty())
        {
            os << "No dreams found.\n\n";
            flush();
            return;
        }

        for (const auto id : matches)
        {
            const auto it = std::find_if(dreams.begin(), dreams.end(),
                                         [id](const core::DreamRecord &d) { return d.id() == id; });
            os << "  #" << std::left << std::setw(6) << id << std::right;
            if (it != dreams.end())
            {
                os << Utils::formatDate(it->date()) << "  ";
                if (it->isLucid())
                    os << color(kCyan) << "[lucid] " << color(kReset);
                os << it->title();
            }
            os << "\n";
        }
        os << matches.size() << " dream(s) found.\n\n";
        flush();
    }

    void ConsoleReporter::flush()
    {
        m_output->flush();
    }

    // ---- Sections ----

    void ConsoleReporter::printDreamStats(const core::DreamStats &stats)
    {
        auto &os = *m_output;
        printHeading("Dream Statistics");
        os << "Total dreams:        " << stats.totalDreams << "\n";
        os << "Lucid dreams:        " << stats.lucidDreams << " ("
           << fixed(stats.lucidPercentage, 1) << "%)\n";
        os << "Average word count:  " << formatOptional(stats.averageWordCount, 1) << "\n";
        os << "Days with dreams:    " << stats.dreamsByDay.size() << "\n";

        if (!stats.dreamsByMonth.empty())
        {
            os << "By month:\n";
            for (const auto &[month, count] : stats.dreamsByMonth)
                os << "  " << Utils::formatYearMonth(month) << "  " << count << "\n";
        }

        if (m_verbosity == Verbosity::VERBOSE && !stats.dreamsByWeek.empty())
        {
            os << "By week:\n";
            for (const auto &[week, count] : stats.dreamsByWeek)
                os << "  " << Utils::formatIsoWeek(week) << "  " << count << "\n";
        }
        os << "\n";
    }

    void ConsoleReporter::printWordRanking(const char *title, const std::vector<core::WordCount> &words)
    {
        auto &os = *m_output;
        printHeading(title);

        if (words.empty())
        {
            os << "no data\n\n";
            return;
        }

        const int colWord  = 24;
        const int colCount = 8;
        for (std::size_t i = 0; i < words.size(); ++i)
        {
            os << std::right << std::setw(3) << (i + 1) << ". "
               << std::left << std::setw(colWord) << words[i].word
               << std::right << std::setw(colCount) << words[i].count << "\n";
        }
        os << "\n";
    }

    void ConsoleReporter::printWeeklySummary(const core::WeeklySummary &summary)
    {
        auto &os = *m_output;
        printHeading("Weekly Summary (" + Utils::formatDate(summary.from) + " .. " +
                     Utils::formatDate(summary.to) + ")");
        os << "Dreams:              " << summary.dreams << " (" << summary.lucidDreams << " lucid)\n";
        os << "Dreams per day:      " << fixed(summary.dreamsPerDay, 2) << "\n";
        os << "Average word count:  " << formatOptional(summary.averageWordCount, 1) << "\n\n";
    }

    void ConsoleReporter::printSleepStats(const core::SleepStats &stats)
    {
        auto &os = *m_output;
        printHeading("Sleep");
        os << "Nights tracked:      " << stats.nightsTracked << "\n";
        os << "Average duration:    " << formatOptional(stats.averageDurationHours, 1, " h") << "\n";
        os << "Shortest / longest:  " << formatOptional(stats.minDurationHours, 1, " h") << " / "
           << formatOptional(stats.maxDurationHours, 1, " h") << "\n";
        os << "Average quality:     " << formatOptional(stats.averageQuality, 2, " / 5") << "\n";
        os << "Nights with lucid:   " << formatOptional(stats.lucidNightPercentage, 1, "%") << "\n";
        os << "Quality when lucid:  " << formatOptional(stats.averageQualityOnLucidNights, 2, " / 5") << "\n";

        if (m_verbosity == Verbosity::VERBOSE || stats.durations.size() <= 14)
        {
            for (const auto &night : stats.durations)
            {
                os << "  " << Utils::formatDate(night.date) << " "
                   << color(kGreen) << bar(night.hours / kBarHours, kBarWidth) << color(kReset)
                   << " " << fixed(night.hours, 1) << " h\n";
            }
        }

        os << "\nQuality vs lucidity (days with dreams):\n";
        os << "  Quality  Dream days  Lucid days  Rate\n";
        for (const auto &bucket : stats.qualityVsLucidity)
        {
            std::optional<double> percent;
            if (bucket.lucidityRate)
                percent = *bucket.lucidityRate * 100.0;

            os << "  " << std::setw(7) << bucket.quality
               << std::setw(12) << bucket.dreamDays
               << std::setw(12) << bucket.lucidDreamDays
               << "  " << formatOptional(percent, 1, "%") << "\n";
        }
        os << "\n";
    }

    void ConsoleReporter::printRealityChecks(const core::RealityCheckStats &stats)
    {
        auto &os = *m_output;
        printHeading("Reality Checks");
        os << "Total:               " << stats.total << " over " << stats.loggedDays << " logged day(s)\n";
        os << "Average per day:     " << formatOptional(stats.averagePerDay, 1) << "\n";

        os << "Most active day:     ";
        if (stats.mostActiveDay)
            os << Utils::formatDate(stats.mostActiveDay->date) << " (" << stats.mostActiveDay->count << ")\n";
        else
            os << "no data\n";

        os << "Least active day:    ";
        if (stats.leastActiveDay)
            os << Utils::formatDate(stats.leastActiveDay->date) << " (" << stats.leastActiveDay->count << ")\n";
        else
            os << "no data\n";
        os << "\n";
    }

    void ConsoleReporter::printCalendar(const core::CalendarMonth &calendar)
    {
        auto &os = *m_output;
        printHeading(std::string(Utils::monthName(calendar.month.month)) + " " +
                     std::to_string(calendar.month.year));

        os << " Mo  Tu  We  Th  Fr  Sa  Su\n";
        if (calendar.days.empty())
        {
            os << "\n";
            return;
        }

        const int lead = Utils::isoWeekday(calendar.days.front().date) - 1;
        for (int i = 0; i < lead; ++i)
            os << "    ";

        int column = lead;
        for (const auto &day : calendar.days)
        {
            char cell[8];
            char mark = ' ';
            const char *code = kDim;
            if (day.mark == core::DayMark::LucidDreamLogged)
            {
                mark = '*';
                code = kCyan;
            }
            else if (day.mark == core::DayMark::DreamLogged)
            {
                mark = '+';
                code = kGreen;
            }
            std::snprintf(cell, sizeof(cell), "%3d%c", day.date.day, mark);
            os << color(code) << cell << color(kReset);

            if (++column == 7)
            {
                os << "\n";
                column = 0;
            }
        }
        if (column != 0)
            os << "\n";

        os << "  + dream   * lucid dream\n\n";
    }

    void ConsoleReporter::printTechniques(const core::TechniqueSummary &summary)
    {
        auto &os = *m_output;
        printHeading("Technique Effectiveness");

        if (summary.techniques.empty())
        {
            os << "no data\n\n";
            return;
        }

        for (const auto &t : summary.techniques)
        {
            const char *code = t.recommendation == core::TechniqueRecommendation::KeepAsPrimary ? kGreen
                             : t.recommendation == core::TechniqueRecommendation::CombineWithAnother ? kYellow
                             : kDim;
            os << std::left << std::setw(16) << t.technique << std::right
               << color(code) << bar(t.successRate / 100.0, 20) << color(kReset)
               << " " << std::setw(5) << fixed(t.successRate, 1) << "%"
               << "  (" << t.successes << "/" << t.attempts << ", last "
               << Utils::formatDate(t.lastPracticed) << ")\n";
            os << "    " << core::recommendationToString(t.recommendation) << "\n";
        }

        if (summary.mostEffective)
            os << "Most effective:      " << *summary.mostEffective << "\n";
        if (summary.leastEffective)
            os << "Least effective:     " << *summary.leastEffective << "\n";
        os << "\n";
    }

    // ---- Private helpers ----

    void ConsoleReporter::printHeading(const std::string &title)
    {
        *m_output << color(kBold) << title << color(kReset) << "\n"
                  << std::string(title.size(), '-') << "\n";
    }

    const char *ConsoleReporter::color(const char *code) const noexcept
    {
        return m_colorsEnabled ? code : "";
    }

    std::string ConsoleReporter::formatOptional(const std::optional<double> &value, int precision,
                                                const char *suffix)
    {
        if (!value)
            return "no data";
        return fixed(*value, precision) + suffix;
    }

    std::string ConsoleReporter::bar(double fraction, int width)
    {
        if (width <= 0)
            return {};

        const int full = std::clamp(static_cast<int>(fraction * width + 0.5), 0, width);
        return std::string(static_cast<std::size_t>(full), '#') +
               std::string(static_cast<std::size_t>(width - full), '.');
    }

} // namespace Report
} // namespace LucidLog
