#include "utils/ConfigLoader.hpp"

#include <algorithm>
#include <fstream>

#include "utils/StringUtils.hpp"

namespace LucidLog
{
    namespace Utils
    {
        std::string ConfigLoader::normalizeKey(std::string_view key)
        {
            std::string normalized = toLower(trim(key));
            std::replace(normalized.begin(), normalized.end(), '-', '_');
            return normalized;
        }

        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
                return false;

            loadFromStream(in);
            return true;
        }

        void ConfigLoader::loadFromStream(std::istream &in)
        {
            std::map<std::string, std::string> values;
            std::size_t malformed = 0;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view content = trim(line);
                if (content.empty() || content.front() == '#' || content.front() == ';')
                    continue;

                const auto eq = content.find('=');
                std::string key = eq == std::string_view::npos ? std::string()
                                                               : normalizeKey(content.substr(0, eq));
                if (key.empty())
                {
                    ++malformed;
                    continue;
                }

                values[std::move(key)] = std::string(trim(content.substr(eq + 1)));
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_values.swap(values);
            m_malformedLines = malformed;
        }

        void ConfigLoader::set(std::string_view key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[normalizeKey(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            return getString(key).has_value();
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            const std::string wanted = normalizeKey(key);

            std::lock_guard<std::mutex> lock(m_mutex);
            const auto it = m_values.find(wanted);
            if (it == m_values.end())
                return std::nullopt;
            return it->second;
        }

        std::optional<int> ConfigLoader::getInt(std::string_view key) const
        {
            const auto raw = getString(key);
            return raw ? parseInteger<int>(*raw) : std::nullopt;
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            const auto raw = getString(key);
            if (!raw)
                return std::nullopt;

            const std::string_view word = trim(*raw);
            for (const char *yes : {"1", "true", "yes", "on"})
            {
                if (iequals(word, yes))
                    return true;
            }
            for (const char *no : {"0", "false", "no", "off"})
            {
                if (iequals(word, no))
                    return false;
            }
            return std::nullopt;
        }

        std::optional<std::vector<std::string>> ConfigLoader::getList(std::string_view key) const
        {
            const auto raw = getString(key);
            if (!raw)
                return std::nullopt;
            return splitAndTrim(*raw, ',');
        }

        std::vector<std::string> ConfigLoader::unknownKeys(const std::vector<std::string> &known) const
        {
            std::vector<std::string> normalizedKnown;
            normalizedKnown.reserve(known.size());
            for (const auto &key : known)
                normalizedKnown.push_back(normalizeKey(key));

            std::vector<std::string> unknown;
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto &entry : m_values)
            {
                if (std::find(normalizedKnown.begin(), normalizedKnown.end(), entry.first) == normalizedKnown.end())
                    unknown.push_back(entry.first);
            }
            return unknown;
        }

    } // namespace Utils
} // namespace LucidLog
