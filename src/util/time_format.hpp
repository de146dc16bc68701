#ifndef SENSISCAN_UTIL_TIME_FORMAT_HPP
#define SENSISCAN_UTIL_TIME_FORMAT_HPP

#include <chrono>
#include <ctime>
#include <cstdint>
#include <cstdio>
#include <string>
#include <stdexcept>

/**
 * @file time_format.hpp
 * @brief UTC ISO-8601 rendering for timestamps written to the audit log and
 *        feedback ledger, plus epoch-millisecond conversions used by the
 *        binary record codec.
 */

namespace sensiscan {
namespace util {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline int64_t toEpochMillis(TimePoint tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint fromEpochMillis(int64_t ms)
{
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

/**
 * @brief Render as "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
inline std::string toIso8601(TimePoint tp)
{
    int64_t ms = toEpochMillis(tp);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm_buf{};
    gmtime_r(&secs, &tm_buf);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);
    return buffer;
}

/**
 * @brief Parse the format written by toIso8601().
 * @throw std::runtime_error on malformed input.
 */
inline TimePoint fromIso8601(const std::string &text)
{
    std::tm tm_buf{};
    int millis = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
                        &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                        &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &millis);
    if (n < 6) {
        throw std::runtime_error("time_format: cannot parse timestamp '" + text + "'");
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    std::time_t secs = timegm(&tm_buf);
    return fromEpochMillis(static_cast<int64_t>(secs) * 1000 + millis);
}

} // namespace util
} // namespace sensiscan

#endif // SENSISCAN_UTIL_TIME_FORMAT_HPP
