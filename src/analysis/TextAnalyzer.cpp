#include "analysis/TextAnalyzer.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        const std::vector<std::string> &TextAnalyzer::defaultStopWords()
        {
            static const std::vector<std::string> kStopWords = {
                "a", "an", "and", "are", "as", "at", "be", "by", "for", "from",
                "has", "he", "in", "is", "it", "its", "of", "on", "that", "the",
                "to", "was", "were", "will", "with", "this", "but", "they", "have",
                "had", "what", "when", "where", "who", "which", "why", "how", "all",
                "each", "every", "both", "few", "more", "most", "other", "some", "such",
                "no", "nor", "not", "only", "own", "same", "so", "than", "too", "very",
                "can", "just", "should", "now", "i", "im", "ive", "id",
                "you", "your", "we", "our", "us", "or", "if", "do", "did", "does",
                "about", "up", "out", "would", "could", "may", "might", "been",
                "also", "into", "over", "after", "before", "through", "between",
                "her", "him", "his", "she", "them", "their", "my", "me",
                "any", "there", "then", "these", "those", "am", "being",
                "here", "while", "during", "under", "again", "once", "like", "got"
            };
            return kStopWords;
        }

        TextAnalyzer::TextAnalyzer()
            : TextAnalyzer(defaultStopWords(), kDefaultMinWordLength)
        {
        }

        TextAnalyzer::TextAnalyzer(const std::vector<std::string> &stopWords,
                                   std::size_t minWordLength)
            : m_minWordLength(minWordLength)
        {
            for (const auto &word : stopWords)
            {
                std::string norm = normalize(word);
                if (!norm.empty())
                    m_stopWords.insert(std::move(norm));
            }
        }

        std::string TextAnalyzer::normalize(std::string_view raw)
        {
            return Utils::toLower(Utils::stripPunctuation(raw));
        }

        bool TextAnalyzer::isStopWord(const std::string &token) const
        {
            return m_stopWords.find(token) != m_stopWords.end();
        }

        void TextAnalyzer::appendTokens(std::string_view text, std::vector<std::string> &out) const
        {
            std::istringstream iss{std::string(text)};
            for (std::string raw; iss >> raw; )
            {
                std::string token = normalize(raw);
                if (Utils::utf8Length(token) < m_minWordLength || isStopWord(token))
                    continue;
                out.push_back(std::move(token));
            }
        }

        std::vector<std::string> TextAnalyzer::tokenize(std::string_view text) const
        {
            std::vector<std::string> tokens;
            appendTokens(text, tokens);
            return tokens;
        }

        std::vector<core::WordCount> TextAnalyzer::rankWords(const std::vector<core::DreamRecord> &dreams,
                                                             std::size_t limit,
                                                             bool includeTitles) const
        {
            std::vector<std::string> tokens;
            for (const auto &dream : dreams)
            {
                if (includeTitles)
                    appendTokens(dream.title(), tokens);
                appendTokens(dream.content(), tokens);
            }

            auto ranked = rankByFrequency(tokens, limit);

            Utils::getLogger().debug(
                "TextAnalyzer: " + std::to_string(tokens.size()) + " tokens from " +
                std::to_string(dreams.size()) + " dreams, " +
                std::to_string(ranked.size()) + " ranked");

            return ranked;
        }

        std::vector<core::WordCount> TextAnalyzer::rankByFrequency(const std::vector<std::string> &tokens,
                                                                   std::size_t limit)
        {
            // Entries are appended on first sight, so vector order is first-seen order.
            std::vector<core::WordCount> counts;
            std::unordered_map<std::string, std::size_t> indexOf;

            for (const auto &token : tokens)
            {
                auto it = indexOf.find(token);
                if (it == indexOf.end())
                {
                    indexOf.emplace(token, counts.size());
                    counts.push_back(core::WordCount{token, 1});
                }
                else
                {
                    ++counts[it->second].count;
                }
            }

            std::stable_sort(counts.begin(), counts.end(),
                             [](const core::WordCount &a, const core::WordCount &b) {
                                 return a.count > b.count;
                             });

            if (limit > 0 && counts.size() > limit)
                counts.resize(limit);

            return counts;
        }

        std::size_t TextAnalyzer::countWords(std::string_view text)
        {
            std::size_t count = 0;
            bool inWord = false;
            for (unsigned char c : text)
            {
                const bool space = std::isspace(c) != 0;
                if (!space && !inWord)
                    ++count;
                inWord = !space;
            }
            return count;
        }

    } // namespace Analysis
} // namespace LucidLog
