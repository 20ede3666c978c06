#pragma once

#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace LucidLog
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Settings for one run, read from a "key = value" file and then
         * overridden by command-line flags through set().
         *
         *   # report
         *   top_words        = 15
         *   calendar_month   = 2024-02
         *   extra_stop_words = really, suddenly
         *   ; logging
         *   log_level        = debug
         *
         * Keys are normalised (trimmed, lower case, '-' read as '_'), so
         * "Top-Words" and "top_words" name the same setting. A repeated key
         * keeps its last value. Lines starting with '#' or ';' are comments;
         * other lines without '=' are counted by malformedLines().
         *
         * Getters return std::nullopt both for a missing key and for a value
         * that does not parse; callers that must tell the two apart check
         * getString() first.
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            /// False if the file cannot be opened; current values are kept then.
            bool loadFromFile(const std::string &filePath);

            /// Replaces all current values.
            void loadFromStream(std::istream &in);

            void set(std::string_view key, std::string value);

            bool hasKey(std::string_view key) const;

            std::optional<std::string> getString(std::string_view key) const;
            std::optional<int> getInt(std::string_view key) const;

            /// 1/true/yes/on and 0/false/no/off, case-insensitive.
            std::optional<bool> getBool(std::string_view key) const;

            /// Comma-separated, items trimmed, empty items dropped.
            std::optional<std::vector<std::string>> getList(std::string_view key) const;

            /// Keys present in the configuration but not in known, sorted.
            std::vector<std::string> unknownKeys(const std::vector<std::string> &known) const;

            std::size_t malformedLines() const noexcept { return m_malformedLines; }

            static std::string normalizeKey(std::string_view key);

        private:
            std::map<std::string, std::string> m_values;
            std::size_t m_malformedLines = 0;
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace LucidLog
