#include "utils/Logger.hpp"

#include <iostream>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
    namespace Utils
    {
        std::optional<LogLevel> parseLogLevel(std::string_view name)
        {
            static constexpr LogLevel kLevels[] = {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO,
                                                   LogLevel::WARN,  LogLevel::ERROR, LogLevel::CRITICAL};

            const std::string_view wanted = trim(name);
            if (iequals(wanted, "warning"))
                return LogLevel::WARN;

            for (const LogLevel level : kLevels)
            {
                if (iequals(wanted, logLevelName(level)))
                    return level;
            }
            return std::nullopt;
        }

        const char *logLevelName(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::TRACE:    return "TRACE";
            case LogLevel::DEBUG:    return "DEBUG";
            case LogLevel::INFO:     return "INFO";
            case LogLevel::WARN:     return "WARN";
            case LogLevel::ERROR:    return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN";
            }
        }

        Logger::Logger()
            : m_level(LogLevel::INFO)
        {
        }

        Logger::~Logger()
        {
            if (m_file.is_open())
                m_file.flush();
        }

        bool Logger::setLogFile(const std::string &filePath)
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);

            if (m_file.is_open())
                m_file.close();
            m_file.clear();

            if (filePath.empty())
                return true;

            m_file.open(filePath, std::ios::out | std::ios::app);
            return m_file.is_open();
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            if (!isEnabled(level))
                return;

            std::string line = "[" + formatTimestamp(now()) + "] [" + logLevelName(level) + "] ";
            line.append(message);
            line.push_back('\n');

            std::lock_guard<std::mutex> lock(m_writeMutex);
            std::cerr << line << std::flush;
            if (m_file.is_open())
                m_file << line << std::flush;
        }

        Logger &getLogger()
        {
            static Logger instance;
            return instance;
        }

    } // namespace Utils
} // namespace LucidLog
