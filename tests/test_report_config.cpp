#include "analysis/ReportConfig.hpp"
#include <gtest/gtest.h>

#include <algorithm>

#include "analysis/TextAnalyzer.hpp"
#include "utils/TimeUtils.hpp"

using namespace LucidLog;

TEST(ReportConfig, Defaults) {
    const Analysis::ReportConfig config;
    EXPECT_EQ(config.topWords, 10);
    EXPECT_EQ(config.minWordLength, 3);
    EXPECT_FALSE(config.includeTitles);
    EXPECT_EQ(config.stopWords, Analysis::TextAnalyzer::defaultStopWords());
    EXPECT_TRUE(Utils::isValidYearMonth(config.calendarMonth));
    EXPECT_TRUE(Utils::isValidDate(config.referenceDate));
    EXPECT_FALSE(Analysis::validateConfig(config).has_value());
}

TEST(ReportConfig, ValidationRejectsBadValues) {
    Analysis::ReportConfig config;
    config.topWords = 0;
    auto error = Analysis::validateConfig(config);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, core::AnalysisErrorKind::ConfigurationError);
    EXPECT_EQ(error->subject, "top_words");

    config = Analysis::ReportConfig{};
    config.minWordLength = -1;
    EXPECT_EQ(Analysis::validateConfig(config)->subject, "min_word_length");

    config = Analysis::ReportConfig{};
    config.calendarMonth = core::YearMonth{2024, 13};
    EXPECT_EQ(Analysis::validateConfig(config)->rule, "calendar-month-range");

    config = Analysis::ReportConfig{};
    config.calendarMonth = core::YearMonth{0, 5};
    EXPECT_EQ(Analysis::validateConfig(config)->rule, "calendar-year-range");

    config = Analysis::ReportConfig{};
    config.referenceDate = core::Date{2023, 2, 30};
    EXPECT_EQ(Analysis::validateConfig(config)->subject, "reference_date");
}

TEST(ReportConfig, LoadsRecognisedKeys) {
    Utils::ConfigLoader loader;
    loader.set("top_words", "5");
    loader.set("min_word_length", "4");
    loader.set("calendar_month", "2024-02");
    loader.set("reference_date", "2024-02-07");
    loader.set("include_titles", "on");
    loader.set("stop_words", "castle, river");
    loader.set("extra_stop_words", "ocean");

    Analysis::ReportConfig config;
    ASSERT_FALSE(Analysis::loadReportConfig(loader, config).has_value());
    EXPECT_EQ(config.topWords, 5);
    EXPECT_EQ(config.minWordLength, 4);
    EXPECT_EQ(config.calendarMonth, (core::YearMonth{2024, 2}));
    EXPECT_EQ(config.referenceDate, (core::Date{2024, 2, 7}));
    EXPECT_TRUE(config.includeTitles);
    EXPECT_EQ(config.stopWords, (std::vector<std::string>{"castle", "river", "ocean"}));
}

TEST(ReportConfig, ExtraStopWordsExtendDefaults) {
    Utils::ConfigLoader loader;
    loader.set("extra_stop_words", "suddenly");

    Analysis::ReportConfig config;
    ASSERT_FALSE(Analysis::loadReportConfig(loader, config).has_value());
    EXPECT_EQ(config.stopWords.size(), Analysis::TextAnalyzer::defaultStopWords().size() + 1);
    EXPECT_EQ(config.stopWords.back(), "suddenly");
}

TEST(ReportConfig, UnparsableValuesAreReported) {
    Utils::ConfigLoader loader;
    loader.set("calendar_month", "February");

    Analysis::ReportConfig config;
    const auto error = Analysis::loadReportConfig(loader, config);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, core::AnalysisErrorKind::ConfigurationError);
    EXPECT_EQ(error->subject, "calendar_month");

    Utils::ConfigLoader numbers;
    numbers.set("top_words", "ten");
    EXPECT_EQ(Analysis::loadReportConfig(numbers, config)->subject, "top_words");
}

TEST(ReportConfig, RecognisedKeysCoverLoader) {
    Utils::ConfigLoader loader;
    loader.set("top_words", "4");
    loader.set("extra_stop_words", "glass");
    loader.set("colour", "on");

    const auto unknown = loader.unknownKeys(Analysis::reportConfigKeys());
    ASSERT_EQ(unknown.size(), 1u);
    EXPECT_EQ(unknown[0], "colour");
}
