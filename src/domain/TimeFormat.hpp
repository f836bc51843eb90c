/**
 * @file TimeFormat.hpp
 * @brief Timestamp alias and conversions used by storage (epoch millis) and the wire (ISO-8601).
 */

#pragma once

#include <chrono>
#include <ctime>
#include <cstdio>
#include <string>

namespace reflectcore::domain {

using Timestamp = std::chrono::system_clock::time_point;

inline long long ToEpochMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp FromEpochMillis(long long ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

/**
 * @brief Formats a timestamp as ISO-8601 UTC with second precision ("2026-01-07T10:15:00Z").
 */
inline std::string ToIso8601(Timestamp ts) {
    std::time_t tt = std::chrono::system_clock::to_time_t(ts);
    std::tm gmt = {};
#if defined(_WIN32)
    gmtime_s(&gmt, &tt);
#else
    gmtime_r(&tt, &gmt);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return std::string(buf);
}

/**
 * @brief Elapsed time between two instants in fractional days, clamped at zero.
 */
inline double DaysBetween(Timestamp from, Timestamp to) {
    if (to <= from) return 0.0;
    std::chrono::duration<double> secs = to - from;
    return secs.count() / 86400.0;
}

} // namespace reflectcore::domain
