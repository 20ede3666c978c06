#include "analysis/TextAnalyzer.hpp"
#include <gtest/gtest.h>

#include "TestJournal.hpp"

using namespace LucidLog;
using Testing::dream;

TEST(TextAnalyzer, NormalisesAndFilters) {
    Analysis::TextAnalyzer analyzer;
    const auto tokens = analyzer.tokenize("The OCEAN was glowing, and I flew over it!");

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "ocean");
    EXPECT_EQ(tokens[1], "glowing");
    EXPECT_EQ(tokens[2], "flew");
}

TEST(TextAnalyzer, StripsPunctuationInsideWords) {
    Analysis::TextAnalyzer analyzer(std::vector<std::string>{}, 3);
    const auto tokens = analyzer.tokenize("don't stop-sign");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], "dont");
    EXPECT_EQ(tokens[1], "stopsign");
}

TEST(TextAnalyzer, CustomStopWordsAreNormalised) {
    Analysis::TextAnalyzer analyzer(std::vector<std::string>{"Ocean!"}, 1);
    const auto tokens = analyzer.tokenize("ocean waves");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], "waves");
}

TEST(TextAnalyzer, MinimumWordLength) {
    Analysis::TextAnalyzer analyzer(std::vector<std::string>{}, 5);
    const auto tokens = analyzer.tokenize("cat horse elephant");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], "horse");
}

TEST(TextAnalyzer, MinimumWordLengthCountsCharacters) {
    Analysis::TextAnalyzer analyzer(std::vector<std::string>{}, 3);
    const auto tokens = analyzer.tokenize("\xC3\xB1o ni\xC3\xB1o");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], "ni\xC3\xB1o");
}

TEST(TextAnalyzer, RankingBreaksTiesByFirstSeen) {
    const std::vector<std::string> tokens = {"water", "teeth", "house", "teeth", "house", "water", "stairs"};
    const auto ranked = Analysis::TextAnalyzer::rankByFrequency(tokens, 0);

    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0], (core::WordCount{"water", 2}));
    EXPECT_EQ(ranked[1], (core::WordCount{"teeth", 2}));
    EXPECT_EQ(ranked[2], (core::WordCount{"house", 2}));
    EXPECT_EQ(ranked[3], (core::WordCount{"stairs", 1}));
}

TEST(TextAnalyzer, RankWordsTruncatesAndIsIdempotent) {
    const std::vector<core::DreamRecord> dreams = {
        dream(1, "2024-01-01 07:00", "forest forest river"),
        dream(2, "2024-01-02 07:00", "river forest mountain"),
    };

    Analysis::TextAnalyzer analyzer;
    const auto first  = analyzer.rankWords(dreams, 2);
    const auto second = analyzer.rankWords(dreams, 2);

    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0], (core::WordCount{"forest", 3}));
    EXPECT_EQ(first[1], (core::WordCount{"river", 2}));
    EXPECT_EQ(first, second);
}

TEST(TextAnalyzer, TitlesOnlyCountedWhenRequested) {
    const std::vector<core::DreamRecord> dreams = {
        dream(1, "2024-01-01 07:00", "river", false, std::nullopt, "Castle"),
    };

    Analysis::TextAnalyzer analyzer;
    EXPECT_EQ(analyzer.rankWords(dreams, 0).size(), 1u);

    const auto withTitles = analyzer.rankWords(dreams, 0, true);
    ASSERT_EQ(withTitles.size(), 2u);
    EXPECT_EQ(withTitles[0].word, "castle");
}

TEST(TextAnalyzer, EmptyCollection) {
    Analysis::TextAnalyzer analyzer;
    EXPECT_TRUE(analyzer.rankWords({}, 10).empty());
    EXPECT_EQ(Analysis::TextAnalyzer::countWords("  one two\tthree\n"), 3u);
    EXPECT_EQ(Analysis::TextAnalyzer::countWords(""), 0u);
}
