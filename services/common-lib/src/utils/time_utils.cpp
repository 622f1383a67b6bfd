/**
 * @file time_utils.cpp
 * @brief xs:dateTime parsing and formatting implementation
 */

#include "saml/utils/time_utils.h"
#include <sstream>
#include <iomanip>
#include <cstring>
#include <ctime>

namespace saml {
namespace utils {

namespace {

/// Maximum fraction digits accepted (nanosecond precision)
constexpr size_t kMaxFractionDigits = 9;

/**
 * @brief Read exactly `width` ASCII digits at `pos`, advancing it
 */
bool readDigits(const std::string& text, size_t& pos, size_t width, int& value) {
    if (pos + width > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += width;
    return true;
}

bool expectChar(const std::string& text, size_t& pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        return false;
    }
    ++pos;
    return true;
}

} // anonymous namespace

std::optional<std::chrono::system_clock::time_point> parseIso8601(
    const std::string& iso8601
) {
    // [-]YYYY-MM-DDThh:mm:ss[.f{1,9}][Z|(+|-)hh:mm]
    size_t pos = 0;
    bool negativeYear = false;
    if (!iso8601.empty() && iso8601[0] == '-') {
        negativeYear = true;
        ++pos;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(iso8601, pos, 4, year) || !expectChar(iso8601, pos, '-') ||
        !readDigits(iso8601, pos, 2, month) || !expectChar(iso8601, pos, '-') ||
        !readDigits(iso8601, pos, 2, day) || !expectChar(iso8601, pos, 'T') ||
        !readDigits(iso8601, pos, 2, hour) || !expectChar(iso8601, pos, ':') ||
        !readDigits(iso8601, pos, 2, minute) || !expectChar(iso8601, pos, ':') ||
        !readDigits(iso8601, pos, 2, second)) {
        return std::nullopt;
    }
    if (negativeYear) {
        year = -year;
    }

    // Fractional seconds, truncated to microseconds
    long micros = 0;
    if (pos < iso8601.size() && iso8601[pos] == '.') {
        ++pos;
        size_t digits = 0;
        long scale = 100000;
        while (pos < iso8601.size() && iso8601[pos] >= '0' && iso8601[pos] <= '9') {
            if (++digits > kMaxFractionDigits) {
                return std::nullopt;
            }
            micros += (iso8601[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
    }

    // Zone designator
    int offsetSign = 0;
    int offHour = 0, offMinute = 0;
    if (pos < iso8601.size()) {
        char zone = iso8601[pos++];
        if (zone == 'Z') {
            // UTC
        } else if (zone == '+' || zone == '-') {
            if (!readDigits(iso8601, pos, 2, offHour) || !expectChar(iso8601, pos, ':') ||
                !readDigits(iso8601, pos, 2, offMinute)) {
                return std::nullopt;
            }
            offsetSign = zone == '+' ? 1 : -1;
        } else {
            return std::nullopt;
        }
    }
    if (pos != iso8601.size()) {
        return std::nullopt;
    }

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;
    if (offHour > 23 || offMinute > 59) return std::nullopt;

    struct tm tm_time;
    std::memset(&tm_time, 0, sizeof(tm_time));
    tm_time.tm_year = year - 1900;
    tm_time.tm_mon = month - 1;
    tm_time.tm_mday = day;
    tm_time.tm_hour = hour;
    tm_time.tm_min = minute;
    tm_time.tm_sec = second;
    tm_time.tm_isdst = 0;

    std::time_t t = timegm(&tm_time);
    auto tp = std::chrono::system_clock::from_time_t(t);
    tp += std::chrono::microseconds(micros);

    // Local time = UTC + offset
    auto offset = std::chrono::hours(offHour) + std::chrono::minutes(offMinute);
    if (offsetSign > 0) {
        tp -= offset;
    } else if (offsetSign < 0) {
        tp += offset;
    }

    return tp;
}

std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds
) {
    std::time_t time_t_value = std::chrono::system_clock::to_time_t(tp);

    struct tm tm_time;
    if (!gmtime_r(&time_t_value, &tm_time)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tm_time.tm_year + 1900) << '-'
        << std::setw(2) << (tm_time.tm_mon + 1) << '-'
        << std::setw(2) << tm_time.tm_mday << 'T'
        << std::setw(2) << tm_time.tm_hour << ':'
        << std::setw(2) << tm_time.tm_min << ':'
        << std::setw(2) << tm_time.tm_sec;

    if (includeMilliseconds) {
        auto sinceSecond = tp - std::chrono::system_clock::from_time_t(time_t_value);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(sinceSecond).count();
        oss << '.' << std::setw(3) << ms;
    }

    oss << 'Z';
    return oss.str();
}

std::chrono::system_clock::time_point fromUnixTimestamp(int64_t timestamp) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(timestamp));
}

int64_t toUnixTimestamp(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

} // namespace utils
} // namespace saml
