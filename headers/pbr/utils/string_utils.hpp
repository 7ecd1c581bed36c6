//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PBR_STRING_UTILS_HPP
#define PBR_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers for log lines and verdict summaries.
 */

#include "pbr/types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace pbr::string_utils {

    /**
     * Trims whitespace from both ends of a string.
     */
    inline std::string_view trim(std::string_view s) noexcept {
        const auto first = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        s.remove_prefix(static_cast<std::size_t>(first - s.begin()));

        const auto last = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - last));
    }

    inline std::string to_upper(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    /**
     * Joins strings with a delimiter.
     *
     * @param parts The strings to join.
     * @param delimiter The delimiter to insert between parts.
     * @return The joined string.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    /**
     * Formats a duration in human-readable form.
     *
     * @return Human-readable string like "1.50s", "250.00ms", "42.00us", "100ns".
     */
    inline std::string format_duration(const Duration duration) {
        constexpr std::int64_t ns_per_s = 1000000000LL;
        constexpr std::int64_t ns_per_ms = 1000000LL;
        constexpr std::int64_t ns_per_us = 1000LL;

        const std::int64_t nanoseconds = duration.count();

        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed;

        if (nanoseconds >= ns_per_s) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_s) << "s";
        } else if (nanoseconds >= ns_per_ms) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_ms) << "ms";
        } else if (nanoseconds >= ns_per_us) {
            oss << static_cast<double>(nanoseconds) / static_cast<double>(ns_per_us) << "us";
        } else {
            oss << nanoseconds << "ns";
        }

        return oss.str();
    }

    /**
     * Formats a byte count in human-readable form.
     *
     * @return Human-readable string like "2.00 MB", "50.00 KB", "512 B".
     */
    inline std::string format_bytes(const std::int64_t bytes) {
        constexpr std::int64_t KB = 1024;
        constexpr std::int64_t MB = KB * 1024;
        constexpr std::int64_t GB = MB * 1024;

        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed;

        if (bytes >= GB) {
            oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
        } else if (bytes >= MB) {
            oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
        } else if (bytes >= KB) {
            oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
        } else {
            oss << bytes << " B";
        }

        return oss.str();
    }

}  // namespace pbr::string_utils

#endif //PBR_STRING_UTILS_HPP
