// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

#include <iomanip>
#include <sstream>

namespace {
    bool isAsciiSpace(char c) noexcept
    {
        return c == ' ' || (c >= '\t' && c <= '\r');
    }

    bool isAsciiPunct(char c) noexcept
    {
        return (c >= '!' && c <= '/') || (c >= ':' && c <= '@') ||
               (c >= '[' && c <= '`') || (c >= '{' && c <= '~');
    }

    char asciiLower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    std::string hexEscape(unsigned char c)
    {
        std::ostringstream oss;
        oss << "\\u" << std::hex << std::uppercase << std::setfill('0') << std::setw(4)
            << static_cast<unsigned int>(c);
        return oss.str();
    }
}

namespace LucidLog::Utils {

std::string_view trim(std::string_view sv) noexcept
{
    std::size_t begin = 0;
    std::size_t end = sv.size();
    while (begin < end && isAsciiSpace(sv[begin])) ++begin;
    while (end > begin && isAsciiSpace(sv[end - 1])) --end;
    return sv.substr(begin, end - begin);
}

std::string toLower(std::string_view sv)
{
    std::string out(sv);
    for (char &c : out)
        c = asciiLower(c);
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (asciiLower(a[i]) != asciiLower(b[i]))
            return false;
    }
    return true;
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle)
{
    if (needle.empty()) return true;
    if (needle.size() > haystack.size()) return false;

    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

std::vector<std::string> splitAndTrim(std::string_view sv, char delimiter)
{
    std::vector<std::string> items;
    while (true)
    {
        const auto pos = sv.find(delimiter);
        const std::string_view item = trim(sv.substr(0, pos));
        if (!item.empty())
            items.emplace_back(item);

        if (pos == std::string_view::npos)
            break;
        sv.remove_prefix(pos + 1);
    }
    return items;
}

std::optional<std::vector<std::string>> splitEscaped(std::string_view line, char delimiter)
{
    std::vector<std::string> fields;
    std::string current;
    current.reserve(line.size());

    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char ch = line[i];
        if (ch == '\\')
        {
            if (i + 1 >= line.size())
                return std::nullopt;

            const char next = line[++i];
            if (next == delimiter || next == '\\')
                current.push_back(next);
            else if (next == 'n')
                current.push_back('\n');
            else
                return std::nullopt;
        }
        else if (ch == delimiter)
        {
            fields.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current.push_back(ch);
        }
    }

    fields.push_back(std::move(current));
    return fields;
}

std::size_t utf8Length(std::string_view s) noexcept
{
    std::size_t count = 0;
    for (const char c : s)
    {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

std::string stripPunctuation(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (const char c : s)
    {
        if (!isAsciiPunct(c))
            out.push_back(c);
    }
    return out;
}

std::string escapeJson(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char uc : s)
    {
        const char c = static_cast<char>(uc);
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (uc < 0x20)
                    out += hexEscape(uc);
                else
                    out += c;
                break;
        }
    }
    return out;
}

} // namespace LucidLog::Utils
