// include/histshard/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <string>
#include "histshard/core/error.hpp"
#include "histshard/core/types.hpp"

namespace histshard {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

inline int64_t to_epoch_ms(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian civil date
 */
int64_t days_from_civil(int year, unsigned month, unsigned day);

/**
 * @brief UTC midnight of the given calendar date
 */
Timestamp make_date(int year, unsigned month, unsigned day);

/**
 * @brief UTC timestamp from calendar fields
 */
Timestamp make_timestamp(int year, unsigned month, unsigned day, int hour = 0, int minute = 0,
                         int second = 0, int millis = 0);

/**
 * @brief Parse "YYYY-MM-DD" as 00:00:00.000 UTC of that date
 * @param text Date string
 * @return Timestamp or INVALID_ARGUMENT
 */
Result<Timestamp> parse_date(const std::string& text);

/**
 * @brief Truncate a timestamp to 00:00 UTC of its day
 */
Timestamp floor_to_day(const Timestamp& ts);

/**
 * @brief Whole UTC calendar days from one timestamp's date to another's
 */
int64_t days_between(const Timestamp& from, const Timestamp& to);

/**
 * @brief Format as "YYYY-MM-DD" in UTC
 */
std::string format_date(const Timestamp& ts);

/**
 * @brief Format as ISO-8601 "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
std::string format_timestamp(const Timestamp& ts);

/**
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace histshard
