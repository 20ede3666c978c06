#include "input/JournalParser.hpp"

#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
    namespace Input
    {
        namespace
        {
            constexpr char kFieldDelimiter = '|';

            constexpr std::size_t kDreamFields    = 8;
            constexpr std::size_t kLogFields      = 9;
            constexpr std::size_t kPracticeFields = 5;

            std::optional<std::string> optionalField(const std::string &raw)
            {
                const std::string_view value = Utils::trim(raw);
                if (value.empty())
                    return std::nullopt;
                return std::string(value);
            }

            std::optional<core::DreamRecord::Id> parseId(std::string_view raw)
            {
                auto value = Utils::parseInteger<long long>(raw);
                if (!value || *value < 0 ||
                    *value > static_cast<long long>(std::numeric_limits<core::DreamRecord::Id>::max()))
                {
                    return std::nullopt;
                }
                return static_cast<core::DreamRecord::Id>(*value);
            }

            bool fieldCountMatches(const std::vector<std::string> &fields, std::size_t expected,
                                   std::string &error)
            {
                if (fields.size() == expected)
                    return true;
                error = "expected " + std::to_string(expected) + " fields for '" + fields.front() +
                        "', found " + std::to_string(fields.size());
                return false;
            }
        } // anonymous namespace

        std::optional<core::DreamRecord> JournalParser::parseDream(const std::vector<std::string> &fields,
                                                                   std::string &error)
        {
            if (!fieldCountMatches(fields, kDreamFields, error))
                return std::nullopt;

            const auto id = parseId(fields[1]);
            if (!id)
            {
                error = "invalid dream id '" + fields[1] + "'";
                return std::nullopt;
            }

            const auto created = Utils::parseDateTime(Utils::trim(fields[2]));
            if (!created)
            {
                error = "invalid timestamp '" + fields[2] + "' (expected YYYY-MM-DD HH:MM)";
                return std::nullopt;
            }

            const std::string_view lucidFlag = Utils::trim(fields[3]);
            if (lucidFlag != "0" && lucidFlag != "1")
            {
                error = "lucid flag must be 0 or 1, got '" + fields[3] + "'";
                return std::nullopt;
            }

            const auto tagList = Utils::splitAndTrim(fields[6], ',');
            std::set<std::string> tags(tagList.begin(), tagList.end());

            return core::DreamRecord(*id, *created, std::string(Utils::trim(fields[5])), fields[7],
                                     std::move(tags), lucidFlag == "1", optionalField(fields[4]));
        }

        std::optional<core::DailyLog> JournalParser::parseDailyLog(const std::vector<std::string> &fields,
                                                                   std::string &error)
        {
            if (!fieldCountMatches(fields, kLogFields, error))
                return std::nullopt;

            const auto date = Utils::parseDate(Utils::trim(fields[1]));
            if (!date)
            {
                error = "invalid date '" + fields[1] + "' (expected YYYY-MM-DD)";
                return std::nullopt;
            }

            const auto bedtime  = Utils::parseTimeOfDay(Utils::trim(fields[2]));
            const auto wakeTime = Utils::parseTimeOfDay(Utils::trim(fields[3]));
            if (!bedtime || !wakeTime)
            {
                error = "invalid bedtime/wake time '" + fields[2] + "'/'" + fields[3] + "' (expected HH:MM)";
                return std::nullopt;
            }

            const auto quality = Utils::parseInteger<int>(fields[4]);
            if (!quality)
            {
                error = "sleep quality is not an integer: '" + fields[4] + "'";
                return std::nullopt;
            }

            const auto checks = Utils::parseInteger<int>(fields[5]);
            if (!checks)
            {
                error = "reality check count is not an integer: '" + fields[5] + "'";
                return std::nullopt;
            }

            std::vector<core::DreamRecord::Id> dreamIds;
            for (const auto &item : Utils::splitAndTrim(fields[8], ','))
            {
                const auto id = parseId(item);
                if (!id)
                {
                    error = "invalid dream reference '" + item + "'";
                    return std::nullopt;
                }
                dreamIds.push_back(*id);
            }

            return core::DailyLog(*date, *bedtime, *wakeTime, *quality, *checks,
                                  optionalField(fields[6]), optionalField(fields[7]), std::move(dreamIds));
        }

        std::optional<core::TechniquePractice> JournalParser::parsePractice(const std::vector<std::string> &fields,
                                                                            std::string &error)
        {
            if (!fieldCountMatches(fields, kPracticeFields, error))
                return std::nullopt;

            core::TechniquePractice practice;
            practice.technique = std::string(Utils::trim(fields[1]));

            const auto date = Utils::parseDate(Utils::trim(fields[2]));
            if (!date)
            {
                error = "invalid date '" + fields[2] + "' (expected YYYY-MM-DD)";
                return std::nullopt;
            }
            practice.date = *date;

            const auto minutes = Utils::parseInteger<int>(fields[3]);
            if (!minutes)
            {
                error = "duration is not an integer: '" + fields[3] + "'";
                return std::nullopt;
            }
            practice.durationMinutes = *minutes;

            std::string_view outcome = Utils::trim(fields[4]);
            std::optional<std::string_view> level;
            if (const auto colon = outcome.find(':'); colon != std::string_view::npos)
            {
                level   = outcome.substr(colon + 1);
                outcome = Utils::trim(outcome.substr(0, colon));
            }

            if (Utils::iequals(outcome, "unattempted"))
                practice.outcome = core::PracticeOutcome::Unattempted;
            else if (Utils::iequals(outcome, "failed"))
                practice.outcome = core::PracticeOutcome::Failed;
            else if (Utils::iequals(outcome, "partial"))
                practice.outcome = core::PracticeOutcome::PartialLucid;
            else if (Utils::iequals(outcome, "full"))
                practice.outcome = core::PracticeOutcome::FullLucid;
            else
            {
                error = "unknown outcome '" + std::string(outcome) + "'";
                return std::nullopt;
            }

            if (level && practice.outcome != core::PracticeOutcome::FullLucid)
            {
                error = "control level is only allowed for 'full'";
                return std::nullopt;
            }

            if (practice.outcome == core::PracticeOutcome::FullLucid)
            {
                practice.controlLevel = kDefaultControlLevel;
                if (level)
                {
                    const auto value = Utils::parseInteger<int>(*level);
                    if (!value || *value < kMinControlLevel || *value > kMaxControlLevel)
                    {
                        error = "control level must be 1..5, got '" + std::string(*level) + "'";
                        return std::nullopt;
                    }
                    practice.controlLevel = *value;
                }
            }

            return practice;
        }

        JournalParser::ParseResult JournalParser::parseLine(std::string_view rawLine) const
        {
            ParseResult result;

            const std::string_view line = Utils::trim(rawLine);
            if (line.empty() || line.front() == '#')
            {
                result.skipped = true;
                return result;
            }

            auto fields = Utils::splitEscaped(line, kFieldDelimiter);
            if (!fields)
            {
                result.error = "invalid escape sequence";
                return result;
            }

            const std::string kind = Utils::toLower(Utils::trim(fields->front()));
            (*fields)[0] = kind;

            if (kind == "dream")
            {
                if (auto dream = parseDream(*fields, result.error))
                    result.record = std::move(*dream);
            }
            else if (kind == "log")
            {
                if (auto log = parseDailyLog(*fields, result.error))
                    result.record = std::move(*log);
            }
            else if (kind == "practice")
            {
                if (auto practice = parsePractice(*fields, result.error))
                    result.record = std::move(*practice);
            }
            else
            {
                result.error = "unknown record type '" + kind + "'";
            }

            return result;
        }

        JournalParser::LoadResult JournalParser::load(FileReader &reader) const
        {
            LoadResult result;
            result.opened = reader.isOpen();
            if (!result.opened)
                return result;

            while (auto line = reader.nextLine())
            {
                ++result.linesRead;

                ParseResult parsed = parseLine(*line);
                if (parsed.skipped)
                    continue;

                if (!parsed.record)
                {
                    result.errors.push_back(LineError{reader.lineNumber(), parsed.error});
                    continue;
                }

                std::visit(
                    [&result](auto &&record) {
                        using T = std::decay_t<decltype(record)>;
                        if constexpr (std::is_same_v<T, core::DreamRecord>)
                            result.snapshot.dreams.push_back(std::move(record));
                        else if constexpr (std::is_same_v<T, core::DailyLog>)
                            result.snapshot.dailyLogs.push_back(std::move(record));
                        else
                            result.snapshot.practices.push_back(std::move(record));
                    },
                    *parsed.record);
            }

            if (reader.failed())
                result.errors.push_back(LineError{reader.lineNumber() + 1, "read error"});

            return result;
        }

        JournalParser::LoadResult JournalParser::loadFile(const std::string &path) const
        {
            auto &logger = Utils::getLogger();

            FileReader reader(path);
            if (!reader.isOpen())
            {
                logger.error("Cannot open journal file: " + path);
                return LoadResult{};
            }

            LoadResult result = load(reader);
            for (const auto &err : result.errors)
                logger.error(path + ":" + std::to_string(err.line) + ": " + err.message);

            logger.info("Loaded " + path + ": " + std::to_string(result.snapshot.dreams.size()) + " dreams, " +
                        std::to_string(result.snapshot.dailyLogs.size()) + " daily logs, " +
                        std::to_string(result.snapshot.practices.size()) + " practice sessions (" +
                        std::to_string(result.errors.size()) + " malformed lines)");
            return result;
        }

    } // namespace Input
} // namespace LucidLog
