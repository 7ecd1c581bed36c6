//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PBR_LOGGER_HPP
#define PBR_LOGGER_HPP

/**
 * @file logger.hpp
 * @brief Process-wide leveled logger.
 *
 * Lines have the form "[HH:MM:SS] LEVEL: message". Console output goes to
 * std::cerr by default; an optional log file receives the same lines.
 * Configured from the [logging] table of the budget file.
 *
 * Usage:
 * @code
 *     auto& log = log::Logger::get();
 *     log.set_level(log::LogLevel::DEBUG);
 *     log.debug("Replaced budget '%s'", name.c_str());
 * @endcode
 */

#include "pbr/result.hpp"

#include <cstdarg>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace pbr::log {

    enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

    [[nodiscard]] const char* to_string(LogLevel level) noexcept;

    /**
     * Parses a level name, case-insensitively. "WARNING" is accepted for WARN.
     *
     * @return The level, or nullopt for an unknown name.
     */
    [[nodiscard]] std::optional<LogLevel> level_from_string(std::string_view name);

    class Logger {
    public:
        static Logger& get();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void set_level(LogLevel level);
        [[nodiscard]] LogLevel level() const;

        /**
         * Enables or disables console output.
         */
        void set_console(bool enabled);

        /**
         * Redirects console output. The stream must outlive the logger or
         * be reset with reset_stream() before it is destroyed.
         */
        void set_stream(std::ostream& stream);
        void reset_stream();

        /**
         * Appends log lines to a file in addition to the console.
         *
         * @param path File to append to. An empty path closes the current file.
         * @return Success, or an IoError if the file cannot be opened.
         */
        [[nodiscard]] Result<void> set_file(const std::string& path);

        [[nodiscard]] bool is_enabled(LogLevel level) const;

        void trace(const char* fmt, ...);
        void debug(const char* fmt, ...);
        void info(const char* fmt, ...);
        void warn(const char* fmt, ...);
        void error(const char* fmt, ...);

        void flush();

    private:
        Logger();
        ~Logger() = default;

        void log(LogLevel level, const char* fmt, va_list args);

        mutable std::mutex mutex_;
        LogLevel level_ = LogLevel::INFO;
        bool console_ = true;
        std::ostream* stream_;
        std::ofstream file_;
    };

}  // namespace pbr::log

#endif //PBR_LOGGER_HPP
