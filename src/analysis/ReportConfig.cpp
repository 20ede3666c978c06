#include "analysis/ReportConfig.hpp"

#include <string>
#include <utility>

#include "analysis/TextAnalyzer.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        ReportConfig::ReportConfig()
            : topWords(kDefaultTopWords),
              calendarMonth(Utils::currentYearMonth()),
              stopWords(TextAnalyzer::defaultStopWords()),
              minWordLength(static_cast<int>(TextAnalyzer::kDefaultMinWordLength)),
              includeTitles(false),
              referenceDate(Utils::today())
        {
        }

        const std::vector<std::string> &reportConfigKeys()
        {
            static const std::vector<std::string> kKeys = {
                "top_words",      "min_word_length", "calendar_month",   "reference_date",
                "include_titles", "stop_words",      "extra_stop_words",
            };
            return kKeys;
        }

        std::optional<core::AnalysisError> validateConfig(const ReportConfig &config)
        {
            if (config.topWords <= 0)
            {
                return core::configurationError("top-words-positive", "top_words",
                                                "must be greater than zero, got " +
                                                    std::to_string(config.topWords));
            }
            if (config.minWordLength <= 0)
            {
                return core::configurationError("min-word-length-positive", "min_word_length",
                                                "must be greater than zero, got " +
                                                    std::to_string(config.minWordLength));
            }
            if (config.calendarMonth.month < 1 || config.calendarMonth.month > 12)
            {
                return core::configurationError("calendar-month-range", "calendar_month",
                                                "month " + std::to_string(config.calendarMonth.month) +
                                                    " is outside 1..12");
            }
            if (!Utils::isValidYearMonth(config.calendarMonth))
            {
                return core::configurationError("calendar-year-range", "calendar_month",
                                                "year " + std::to_string(config.calendarMonth.year) +
                                                    " is outside 1..9999");
            }
            if (!Utils::isValidDate(config.referenceDate))
            {
                return core::configurationError("invalid-reference-date", "reference_date",
                                                "not a valid calendar date");
            }
            return std::nullopt;
        }

        std::optional<core::AnalysisError> loadReportConfig(const Utils::ConfigLoader &loader,
                                                            ReportConfig &config)
        {
            auto invalid = [](const char *key, const std::string &raw, const char *expected) {
                return core::configurationError("unparsable-value", key,
                                                "'" + raw + "' is not " + expected);
            };

            if (auto raw = loader.getString("top_words"))
            {
                auto value = loader.getInt("top_words");
                if (!value)
                    return invalid("top_words", *raw, "an integer");
                config.topWords = *value;
            }

            if (auto raw = loader.getString("min_word_length"))
            {
                auto value = loader.getInt("min_word_length");
                if (!value)
                    return invalid("min_word_length", *raw, "an integer");
                config.minWordLength = *value;
            }

            if (auto raw = loader.getString("calendar_month"))
            {
                auto value = Utils::parseYearMonth(*raw);
                if (!value)
                    return invalid("calendar_month", *raw, "a YYYY-MM month");
                config.calendarMonth = *value;
            }

            if (auto raw = loader.getString("reference_date"))
            {
                auto value = Utils::parseDate(*raw);
                if (!value)
                    return invalid("reference_date", *raw, "a YYYY-MM-DD date");
                config.referenceDate = *value;
            }

            if (auto raw = loader.getString("include_titles"))
            {
                auto value = loader.getBool("include_titles");
                if (!value)
                    return invalid("include_titles", *raw, "a boolean");
                config.includeTitles = *value;
            }

            if (auto words = loader.getList("stop_words"))
                config.stopWords = std::move(*words);

            if (auto extra = loader.getList("extra_stop_words"))
                config.stopWords.insert(config.stopWords.end(), extra->begin(), extra->end());

            return std::nullopt;
        }

    } // namespace Analysis
} // namespace LucidLog
