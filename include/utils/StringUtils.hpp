#pragma once

#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace LucidLog
{
    namespace Utils
    {
        /*
         * Text helpers for journal lines, dream content and config values.
         *
         * Character classes are ASCII only and independent of the C locale:
         * bytes of multi-byte UTF-8 sequences are never treated as space or
         * punctuation and are never case-mapped, so non-English journal text
         * passes through unchanged.
         */

        /// Without leading/trailing space, tab, CR, LF, VT or FF.
        std::string_view trim(std::string_view sv) noexcept;

        std::string toLower(std::string_view sv);

        bool iequals(std::string_view a, std::string_view b) noexcept;

        /// An empty needle matches everything.
        bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

        /// Split on delimiter, trim every item and drop the empty ones.
        std::vector<std::string> splitAndTrim(std::string_view sv, char delimiter);

        /**
         * Split a journal line on an unescaped delimiter.
         *
         * Recognised escapes: "\<delimiter>", "\\" and "\n" (newline).
         * Empty fields are preserved. Returns std::nullopt for a dangling
         * backslash or an unknown escape.
         */
        std::optional<std::vector<std::string>> splitEscaped(std::string_view line, char delimiter);

        /// Number of UTF-8 code points; continuation bytes are not counted.
        std::size_t utf8Length(std::string_view s) noexcept;

        /// Remove every ASCII punctuation character.
        std::string stripPunctuation(std::string_view s);

        /// Escape for use inside a JSON string literal (quotes not added).
        std::string escapeJson(std::string_view s);

        /**
         * Whole-string integer parse; surrounding whitespace is allowed,
         * anything else after the number is not.
         */
        template <typename IntType>
        std::optional<IntType> parseInteger(std::string_view sv)
        {
            static_assert(std::is_integral<IntType>::value, "parseInteger requires an integral type");

            const std::string_view digits = trim(sv);
            if (digits.empty())
                return std::nullopt;

            std::istringstream iss{std::string(digits)};
            IntType value{};
            if (!(iss >> value) || !iss.eof())
                return std::nullopt;
            return value;
        }

    } // namespace Utils
} // namespace LucidLog
