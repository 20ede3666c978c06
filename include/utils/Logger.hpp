#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace LucidLog
{
    namespace Utils
    {
        /**
         * Severity of a diagnostic line.
         *
         *  - TRACE: per-record detail while loading a journal
         *  - DEBUG: calculator results
         *  - INFO: journal loaded, report assembled
         *  - WARN: input that is accepted but looks wrong (dangling dream ids)
         *  - ERROR: rejected journal, snapshot or configuration
         *  - CRITICAL: the host cannot continue
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// "debug", "INFO", "warning", ...; nullopt for anything else.
        std::optional<LogLevel> parseLogLevel(std::string_view name);

        const char *logLevelName(LogLevel level) noexcept;

        /**
         * Logger
         *
         * Diagnostics for the engine and the host. Lines look like
         * "[2024-02-01 07:12:03] [INFO] Report assembled: ..." and always go
         * to stderr so that a report written to stdout stays clean. A log
         * file (append mode) can be attached as a second sink.
         *
         * The level is atomic: calculators running on several threads test
         * it without contention and only take the mutex to write a line.
         */
        class Logger
        {
        public:
            Logger();

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            void setLevel(LogLevel level) noexcept { m_level.store(level, std::memory_order_relaxed); }
            LogLevel level() const noexcept { return m_level.load(std::memory_order_relaxed); }

            bool isEnabled(LogLevel level) const noexcept
            {
                return static_cast<int>(level) >= static_cast<int>(this->level());
            }

            /**
             * Attach an append-mode log file next to stderr.
             *
             * An empty path detaches the current file. On failure the
             * previous file is already closed and false is returned.
             */
            bool setLogFile(const std::string &filePath);

            void log(LogLevel level, std::string_view message);

            void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)  { log(LogLevel::INFO, message); }
            void warn(std::string_view message)  { log(LogLevel::WARN, message); }
            void error(std::string_view message) { log(LogLevel::ERROR, message); }

        private:
            std::atomic<LogLevel> m_level;
            std::ofstream         m_file;
            std::mutex            m_writeMutex;   // guards m_file and stderr writes
        };

        /// Process-wide logger (stderr, INFO).
        Logger &getLogger();

    } // namespace Utils
} // namespace LucidLog
