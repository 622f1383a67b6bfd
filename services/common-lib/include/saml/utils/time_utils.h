/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Conversion between xs:dateTime lexical values (as carried in SAML
 * NotBefore / NotOnOrAfter attributes) and std::chrono time points.
 *
 * @version 1.0.0
 * @date 2026-10-19
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace saml {
namespace utils {

/**
 * @brief Parse xs:dateTime / ISO 8601 string to time_point
 *
 * Accepts "YYYY-MM-DDThh:mm:ss" with optional fractional seconds (at
 * most 9 digits, truncated to microseconds) and an optional zone designator ("Z" or "+hh:mm" / "-hh:mm"). A value
 * without a zone designator is taken as UTC. Field ranges are checked
 * (month 1-12, day within month, hour 0-23, minute/second 0-59).
 *
 * @param iso8601 ISO 8601 formatted string
 * @return std::chrono time_point, or std::nullopt on error
 */
std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string& iso8601
);

/**
 * @brief Format time_point as ISO 8601 string in UTC
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-10-19T12:34:56Z")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

/**
 * @brief Convert Unix timestamp (seconds since epoch) to time_point
 */
std::chrono::system_clock::time_point fromUnixTimestamp(int64_t timestamp);

/**
 * @brief Convert time_point to Unix timestamp (seconds since epoch)
 */
int64_t toUnixTimestamp(const std::chrono::system_clock::time_point& tp);

/**
 * @brief Check if year is leap year
 */
bool isLeapYear(int year);

/**
 * @brief Get number of days in month
 *
 * @param year Year number
 * @param month Month number (1-12)
 * @return Number of days in month, or 0 for an invalid month
 */
int daysInMonth(int year, int month);

} // namespace utils
} // namespace saml
