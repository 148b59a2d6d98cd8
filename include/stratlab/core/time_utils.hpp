// include/stratlab/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include "stratlab/core/error.hpp"
#include "stratlab/core/types.hpp"

namespace stratlab {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
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
 *
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

/**
 * @brief Inverse of gmtime: interpret a broken-down time as UTC
 */
inline std::time_t safe_timegm(std::tm* time) {
#ifdef _WIN32
    return _mkgmtime(time);
#else
    return timegm(time);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
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

/**
 * @brief Format a timestamp in UTC
 *
 * Bar timestamps are always rendered in UTC so that results never depend on
 * the host time zone.
 *
 * @param ts Timestamp to format
 * @param format Format string compatible with std::put_time
 */
inline std::string format_utc(const Timestamp& ts, const char* format) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm;
    safe_gmtime(&time_t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

inline std::string format_date(const Timestamp& ts) {
    return format_utc(ts, "%Y-%m-%d");
}

inline std::string format_timestamp(const Timestamp& ts) {
    return format_utc(ts, "%Y-%m-%d %H:%M:%S");
}

/**
 * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS" as UTC
 * @param text Input text
 * @return Parsed timestamp or INVALID_ARGUMENT
 */
inline Result<Timestamp> parse_timestamp(const std::string& text) {
    std::string normalized = text;
    auto t_pos = normalized.find('T');
    if (t_pos != std::string::npos) {
        normalized[t_pos] = ' ';
    }

    std::tm tm = {};
    std::istringstream ss(normalized);
    if (normalized.size() > 10) {
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    } else {
        ss >> std::get_time(&tm, "%Y-%m-%d");
    }

    if (ss.fail()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Unparseable timestamp: '" + text + "'", "TimeUtils");
    }

    std::time_t seconds = safe_timegm(&tm);
    return Result<Timestamp>(std::chrono::system_clock::from_time_t(seconds));
}

}  // namespace core
}  // namespace stratlab
