#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/DreamRecord.hpp"
#include "core/StatisticsReport.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        /**
         * TextAnalyzer
         *
         * Word-frequency analysis over dream text.
         *
         * Normalisation: lowercase, strip ASCII punctuation, split on
         * whitespace. Tokens shorter than minWordLength (counted in UTF-8
         * code points) and stop words are dropped. Rankings are ordered by descending count; equal counts keep
         * first-seen order, so the same input always ranks identically.
         *
         * Immutable after construction; every member function is const and
         * safe to call from several threads at once.
         */
        class TextAnalyzer
        {
        public:
            static constexpr std::size_t kDefaultMinWordLength = 3;

            /// Built-in English function-word list.
            static const std::vector<std::string> &defaultStopWords();

            /// Default stop words, minimum word length 3.
            TextAnalyzer();

            /**
             * Custom stop-word set. Entries are normalised the same way as
             * tokens, so "Don't" in the list filters the token "dont".
             */
            explicit TextAnalyzer(const std::vector<std::string> &stopWords,
                                  std::size_t minWordLength = kDefaultMinWordLength);

            /// Normalised, filtered tokens of one text, in reading order.
            std::vector<std::string> tokenize(std::string_view text) const;

            /**
             * Rank words over a dream collection.
             *
             * Dreams are read in snapshot order; with includeTitles each
             * dream's title is read before its content. limit == 0 means no
             * truncation.
             */
            std::vector<core::WordCount> rankWords(const std::vector<core::DreamRecord> &dreams,
                                                   std::size_t limit,
                                                   bool includeTitles = false) const;

            bool isStopWord(const std::string &token) const;

            std::size_t minWordLength() const noexcept { return m_minWordLength; }

            /**
             * Frequency ranking shared by every ranked list in the engine.
             *
             * Stable sort keyed by (-count, first-seen index); limit == 0
             * returns the full ranking.
             */
            static std::vector<core::WordCount> rankByFrequency(const std::vector<std::string> &tokens,
                                                                std::size_t limit);

            /// Plain whitespace-separated word count (no filtering).
            static std::size_t countWords(std::string_view text);

        private:
            static std::string normalize(std::string_view raw);

            void appendTokens(std::string_view text, std::vector<std::string> &out) const;

        private:
            std::unordered_set<std::string> m_stopWords;
            std::size_t m_minWordLength = kDefaultMinWordLength;
        };

    } // namespace Analysis
} // namespace LucidLog
