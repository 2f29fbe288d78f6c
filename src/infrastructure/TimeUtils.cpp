/**
 * @file TimeUtils.cpp
 * @brief Implementation of TimeUtils.
 */

#include "infrastructure/TimeUtils.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace reflect::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::time_t FromUtcTime(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

std::string FormatDate(const std::tm& tm) {
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

} // namespace

std::string TimeUtils::FormatBackupTimestamp(std::chrono::system_clock::time_point tp) {
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(tp));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

std::string TimeUtils::IsoTimestamp(std::chrono::system_clock::time_point tp) {
    std::tm tm = ToUtcTime(std::chrono::system_clock::to_time_t(tp));
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::string TimeUtils::DateDaysAgo(int days, std::chrono::system_clock::time_point now) {
    std::time_t tt = std::chrono::system_clock::to_time_t(now) - static_cast<std::time_t>(days) * 86400;
    return FormatDate(ToUtcTime(tt));
}

bool TimeUtils::IsDate(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') return false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
    }
    return true;
}

std::optional<std::string> TimeUtils::NextDay(const std::string& date) {
    if (!IsDate(date)) return std::nullopt;
    std::tm tm = {};
    tm.tm_year = std::stoi(date.substr(0, 4)) - 1900;
    tm.tm_mon = std::stoi(date.substr(5, 2)) - 1;
    tm.tm_mday = std::stoi(date.substr(8, 2)) + 1;
    tm.tm_hour = 12;
    std::time_t tt = FromUtcTime(&tm);
    return FormatDate(ToUtcTime(tt));
}

} // namespace reflect::infrastructure
