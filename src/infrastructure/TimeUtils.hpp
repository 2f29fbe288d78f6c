/**
 * @file TimeUtils.hpp
 * @brief UTC calendar helpers for session dates, backups and history timestamps.
 */

#pragma once
#include <string>
#include <optional>
#include <chrono>

namespace reflect::infrastructure {

class TimeUtils {
public:
    /** @brief "YYYYMMDD_HHMMSS" in UTC; exactly 15 characters, no punctuation besides the underscore. */
    static std::string FormatBackupTimestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

    /** @brief "YYYY-MM-DDTHH:MM:SS.mmmZ" in UTC. */
    static std::string IsoTimestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

    /** @brief UTC date "YYYY-MM-DD" of now minus the given number of days. */
    static std::string DateDaysAgo(int days, std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /** @brief Calendar day after a "YYYY-MM-DD" date; nullopt if the input is not a date. */
    static std::optional<std::string> NextDay(const std::string& date);

    /** @brief True for strings of the exact form "YYYY-MM-DD". */
    static bool IsDate(const std::string& value);
};

} // namespace reflect::infrastructure
