// include/chain_risk/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <string>
#include "chain_risk/core/error.hpp"

namespace chain_risk {
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
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise UTC
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result{};

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
 * @brief Parse a "YYYY-MM-DD" calendar date as midnight UTC
 * @return Time point, or INVALID_ARGUMENT if the string is not a valid date
 */
Result<std::chrono::system_clock::time_point> parse_date_utc(const std::string& date);

/**
 * @brief Whole days from a reference time until an expiry date
 *
 * Truncates toward zero, so an expiry later today yields 0 and a past expiry
 * yields a negative count.
 *
 * @param expiry_date Expiry as "YYYY-MM-DD" (midnight UTC)
 * @param from Reference time
 */
Result<int> days_until(const std::string& expiry_date,
                       std::chrono::system_clock::time_point from);

}  // namespace core
}  // namespace chain_risk
