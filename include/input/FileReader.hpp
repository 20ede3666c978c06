#pragma once

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>

namespace LucidLog
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Line-oriented reader over a journal export file.
         *
         * Design notes:
         *  - Owns its std::ifstream (RAII); not copyable, movable.
         *  - Tracks the 1-based number of the last line returned so the
         *    parser can point diagnostics at the offending line.
         *  - Strips a trailing '\r' and a leading UTF-8 byte-order mark.
         */
        class FileReader
        {
        public:
            FileReader() = default;

            /// Open immediately; check isOpen() afterwards.
            explicit FileReader(const std::string &filePath);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            ~FileReader();

            /// Open a file for reading, closing any previous one. Returns false on failure.
            bool open(const std::string &filePath);

            void close() noexcept;

            bool isOpen() const noexcept { return m_stream.is_open(); }

            const std::string &filePath() const noexcept { return m_filePath; }

            /// Next line without its terminator, or std::nullopt at end of file.
            std::optional<std::string> nextLine();

            /// Number of the line most recently returned by nextLine() (0 before the first).
            std::size_t lineNumber() const noexcept { return m_lineNumber; }

            /// True once reading stopped because of an I/O error rather than end of file.
            bool failed() const noexcept { return m_stream.bad(); }

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
            std::size_t   m_lineNumber = 0;
        };

    } // namespace Input
} // namespace LucidLog
