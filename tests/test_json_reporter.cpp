#include "report/JsonReporter.hpp"
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "TestJournal.hpp"

using namespace LucidLog;
using Report::JsonReporter;
using Testing::day;

TEST(JsonReporter, FormatsNumbersWithFixedPrecision) {
    EXPECT_EQ(JsonReporter::formatNumber(25.0), "25.0000");
    EXPECT_EQ(JsonReporter::formatNumber(200.0 / 3.0), "66.6667");
    EXPECT_EQ(JsonReporter::formatNumber(0.0), "0.0000");
}

TEST(JsonReporter, WordCountsKeepRankOrder) {
    const std::vector<core::WordCount> words = {{"forest", 3}, {"river", 2}};
    EXPECT_EQ(JsonReporter::wordCountsToJson(words),
              "[{\"word\":\"forest\",\"count\":3},{\"word\":\"river\",\"count\":2}]");
    EXPECT_EQ(JsonReporter::wordCountsToJson({}), "[]");
}

TEST(JsonReporter, MissingValuesBecomeNull) {
    const core::RealityCheckStats empty;
    EXPECT_EQ(JsonReporter::realityChecksToJson(empty),
              "{\"total\":0,\"loggedDays\":0,\"mostActiveDay\":null,\"leastActiveDay\":null,"
              "\"averagePerDay\":null}");

    core::RealityCheckStats stats;
    stats.total          = 7;
    stats.loggedDays     = 2;
    stats.mostActiveDay  = core::DayCount{day("2024-03-01"), 5};
    stats.leastActiveDay = core::DayCount{day("2024-03-03"), 2};
    stats.averagePerDay  = 3.5;
    EXPECT_EQ(JsonReporter::realityChecksToJson(stats),
              "{\"total\":7,\"loggedDays\":2,"
              "\"mostActiveDay\":{\"date\":\"2024-03-01\",\"count\":5},"
              "\"leastActiveDay\":{\"date\":\"2024-03-03\",\"count\":2},"
              "\"averagePerDay\":3.5000}");
}

TEST(JsonReporter, DreamStatsGroupings) {
    core::DreamStats stats;
    stats.totalDreams     = 4;
    stats.lucidDreams     = 1;
    stats.lucidPercentage = 25.0;
    stats.dreamsByDay[day("2024-01-01")] = 3;
    stats.dreamsByDay[day("2024-01-02")] = 1;
    stats.dreamsByWeek[core::IsoWeek{2024, 1}] = 4;
    stats.dreamsByMonth[core::YearMonth{2024, 1}] = 4;
    stats.commonDreamSigns = {{"flying", 1}};

    EXPECT_EQ(JsonReporter::dreamStatsToJson(stats),
              "{\"total\":4,\"lucid\":1,\"lucidPercentage\":25.0000,\"averageWordCount\":null,"
              "\"byDay\":{\"2024-01-01\":3,\"2024-01-02\":1},"
              "\"byWeek\":{\"2024-W01\":4},"
              "\"byMonth\":{\"2024-01\":4},"
              "\"dreamSigns\":[{\"word\":\"flying\",\"count\":1}]}");
}

TEST(JsonReporter, CalendarAndTechniques) {
    core::CalendarMonth calendar;
    calendar.month = core::YearMonth{2024, 2};
    calendar.days  = {{day("2024-02-01"), core::DayMark::LucidDreamLogged, 2},
                      {day("2024-02-02"), core::DayMark::NoEntry, 0}};
    EXPECT_EQ(JsonReporter::calendarToJson(calendar),
              "{\"month\":\"2024-02\",\"days\":["
              "{\"date\":\"2024-02-01\",\"mark\":\"lucid\",\"dreams\":2},"
              "{\"date\":\"2024-02-02\",\"mark\":\"none\",\"dreams\":0}]}");

    core::TechniqueSummary summary;
    core::TechniqueStats mild;
    mild.technique      = "MILD \"v2\"";
    mild.attempts       = 4;
    mild.successes      = 3;
    mild.successRate    = 75.0;
    mild.lastPracticed  = day("2024-01-09");
    mild.recommendation = core::TechniqueRecommendation::KeepAsPrimary;
    summary.techniques.push_back(mild);

    EXPECT_EQ(JsonReporter::techniquesToJson(summary),
              "{\"techniques\":[{\"technique\":\"MILD \\\"v2\\\"\",\"attempts\":4,\"successes\":3,"
              "\"successRate\":75.0000,\"lastPracticed\":\"2024-01-09\","
              "\"recommendation\":\"Continue using as primary technique\"}],"
              "\"mostEffective\":null,\"leastEffective\":null}");
}

TEST(JsonReporter, PresentOptionalStringsAreQuoted) {
    core::TechniqueSummary summary;
    summary.mostEffective  = "MILD";
    summary.leastEffective = "WBTB \"late\"";
    EXPECT_EQ(JsonReporter::techniquesToJson(summary),
              "{\"techniques\":[],\"mostEffective\":\"MILD\","
              "\"leastEffective\":\"WBTB \\\"late\\\"\"}");
}

TEST(JsonReporter, CompactDocumentLayout) {
    JsonReporter reporter;
    reporter.generateReport(core::StatisticsReport{});
    const std::string json = reporter.getJsonString();

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_EQ(json.find('\n'), std::string::npos);
    EXPECT_EQ(json.rfind("{\"topWords\":[],\"dreams\":", 0), 0u);
    EXPECT_NE(json.find(",\"techniques\":{"), std::string::npos);
    EXPECT_EQ(json.find("\"search\""), std::string::npos);
}

TEST(JsonReporter, PrettyLayoutAndSearchSection) {
    JsonReporter reporter(JsonReporter::PrettyPrint::PRETTY);
    reporter.generateReport(core::StatisticsReport{});
    reporter.setSearchResult("ocean", {7, 5});

    std::ostringstream out;
    reporter.writeJson(out);
    const std::string json = out.str();

    EXPECT_EQ(json.rfind("{\n  \"topWords\": []", 0), 0u);
    EXPECT_NE(json.find("  \"search\": {\"keyword\":\"ocean\",\"matches\":[7,5]}\n}\n"), std::string::npos);

    reporter.setPrettyPrint(JsonReporter::PrettyPrint::COMPACT);
    EXPECT_EQ(reporter.getJsonString().find('\n'), std::string::npos);
}
