//
// Created by gregorian-rayne on 10/19/26.
//

#include "pbr/utils/logger.hpp"
#include "pbr/utils/string_utils.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <vector>

namespace pbr::log {

    namespace {
        constexpr std::array<const char*, 5> level_strings = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};

        std::string format_message(const char* fmt, va_list args) {
            va_list copy;
            va_copy(copy, args);
            const int length = std::vsnprintf(nullptr, 0, fmt, copy);
            va_end(copy);

            if (length <= 0) {
                return {};
            }

            std::vector<char> buffer(static_cast<std::size_t>(length) + 1);
            std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
            return {buffer.data(), static_cast<std::size_t>(length)};
        }
    }

    const char* to_string(const LogLevel level) noexcept {
        const auto index = static_cast<std::size_t>(level);
        return index < level_strings.size() ? level_strings[index] : "UNKNOWN";
    }

    std::optional<LogLevel> level_from_string(const std::string_view name) {
        const std::string upper = string_utils::to_upper(string_utils::trim(name));

        if (upper == "TRACE") return LogLevel::TRACE;
        if (upper == "DEBUG") return LogLevel::DEBUG;
        if (upper == "INFO") return LogLevel::INFO;
        if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
        if (upper == "ERROR") return LogLevel::ERROR;
        return std::nullopt;
    }

    Logger::Logger() : stream_(&std::cerr) {}

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    void Logger::set_level(const LogLevel level) {
        std::lock_guard lock(mutex_);
        level_ = level;
    }

    LogLevel Logger::level() const {
        std::lock_guard lock(mutex_);
        return level_;
    }

    void Logger::set_console(const bool enabled) {
        std::lock_guard lock(mutex_);
        console_ = enabled;
    }

    void Logger::set_stream(std::ostream& stream) {
        std::lock_guard lock(mutex_);
        stream_ = &stream;
    }

    void Logger::reset_stream() {
        std::lock_guard lock(mutex_);
        stream_ = &std::cerr;
    }

    Result<void> Logger::set_file(const std::string& path) {
        std::lock_guard lock(mutex_);

        if (file_.is_open()) {
            file_.close();
        }

        if (path.empty()) {
            return Result<void>::success();
        }

        file_.open(path, std::ios::out | std::ios::app);
        if (!file_) {
            return Result<void>::failure(Error::io_error("Failed to open log file", path));
        }

        return Result<void>::success();
    }

    bool Logger::is_enabled(const LogLevel level) const {
        std::lock_guard lock(mutex_);
        return level >= level_;
    }

    void Logger::trace(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        log(LogLevel::TRACE, fmt, args);
        va_end(args);
    }

    void Logger::debug(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        log(LogLevel::DEBUG, fmt, args);
        va_end(args);
    }

    void Logger::info(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        log(LogLevel::INFO, fmt, args);
        va_end(args);
    }

    void Logger::warn(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        log(LogLevel::WARN, fmt, args);
        va_end(args);
    }

    void Logger::error(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        log(LogLevel::ERROR, fmt, args);
        va_end(args);
    }

    void Logger::log(const LogLevel level, const char* fmt, va_list args) {
        std::lock_guard lock(mutex_);

        if (level < level_) return;
        if (!console_ && !file_.is_open()) return;

        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::array<char, 16> stamp{};
        std::snprintf(stamp.data(), stamp.size(), "[%02d:%02d:%02d] ",
                      local.tm_hour, local.tm_min, local.tm_sec);

        std::string line = stamp.data();
        line += to_string(level);
        line += ": ";
        line += format_message(fmt, args);
        line += '\n';

        if (console_) {
            *stream_ << line;
        }
        if (file_.is_open()) {
            file_ << line;
        }
    }

    void Logger::flush() {
        std::lock_guard lock(mutex_);
        stream_->flush();
        if (file_.is_open()) {
            file_.flush();
        }
    }

}  // namespace pbr::log
