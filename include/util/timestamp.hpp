#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace es::util {

using Clock = std::chrono::system_clock;

inline int64_t toEpochMillis(const Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline Clock::time_point fromEpochMillis(const int64_t ms) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

// Whole-second time_point -> "2025-06-01T12:00:00Z"
inline std::string timestampToString(const Clock::time_point tp) {
    const std::time_t ts = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

}
