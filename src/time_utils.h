#pragma once

#include <string>
#include <optional>
#include <ctime>
#include <cstdint>
#include <cstdio>

/**
 * Timestamp parsing/formatting for play events.
 * All timestamps inside the store are microseconds since the Unix epoch, UTC.
 */
namespace playledger {
namespace time_utils {

constexpr int64_t kMicrosPerSecond = 1000000;
constexpr int64_t kMicrosPerMilli = 1000;

/**
 * Manual parser for an unsigned integer field.
 * Advances pos past the digits consumed and reports how many there were.
 */
inline int parse_int_fast(const char* str, size_t len, size_t& pos, size_t& digits) {
    int result = 0;
    digits = 0;
    for (; pos < len && str[pos] >= '0' && str[pos] <= '9'; ++pos, ++digits) {
        result = result * 10 + (str[pos] - '0');
    }
    return result;
}

/**
 * Days since 1970-01-01 for a proleptic Gregorian date.
 */
inline int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

/**
 * Parse a timestamp string into microseconds since Unix epoch (UTC).
 *
 * Supports:
 * 1. Pure digits: epoch milliseconds (e.g., "1609459200000")
 * 2. ISO8601: "YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+HH:MM|-HH:MM]"
 *    A trailing 'Z' after an offset ("+00:00Z") is tolerated.
 * 3. SQL datetime: "YYYY-MM-DD HH:MM:SS[.ffffff]" (taken as UTC)
 *
 * Returns std::nullopt if the string cannot be parsed.
 */
inline std::optional<int64_t> parse_timestamp_us(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    const char* data = str.data();
    size_t len = str.size();

    // Pure digits = epoch milliseconds
    bool all_digits = true;
    for (size_t i = 0; i < len; ++i) {
        if (data[i] < '0' || data[i] > '9') {
            all_digits = false;
            break;
        }
    }
    if (all_digits) {
        if (len > 18) {
            return std::nullopt;
        }
        int64_t result = 0;
        for (size_t i = 0; i < len; ++i) {
            result = result * 10 + (data[i] - '0');
        }
        return result * kMicrosPerMilli;
    }

    if (len < 19) {
        return std::nullopt;
    }

    size_t pos = 0;
    size_t digits = 0;
    int year = parse_int_fast(data, len, pos, digits);
    if (digits != 4 || pos >= len || data[pos] != '-') return std::nullopt;
    pos++;

    int month = parse_int_fast(data, len, pos, digits);
    if (digits != 2 || month < 1 || month > 12 || pos >= len || data[pos] != '-') return std::nullopt;
    pos++;

    int day = parse_int_fast(data, len, pos, digits);
    if (digits != 2 || day < 1 || day > 31) return std::nullopt;

    if (pos >= len || (data[pos] != 'T' && data[pos] != ' ')) return std::nullopt;
    pos++;

    int hour = parse_int_fast(data, len, pos, digits);
    if (digits != 2 || hour > 23 || pos >= len || data[pos] != ':') return std::nullopt;
    pos++;

    int minute = parse_int_fast(data, len, pos, digits);
    if (digits != 2 || minute > 59 || pos >= len || data[pos] != ':') return std::nullopt;
    pos++;

    int second = parse_int_fast(data, len, pos, digits);
    if (digits != 2 || second > 60) return std::nullopt;

    // Fractional seconds, truncated to microseconds
    int64_t micros = 0;
    if (pos < len && data[pos] == '.') {
        pos++;
        int64_t scale = 100000;
        size_t frac_digits = 0;
        while (pos < len && data[pos] >= '0' && data[pos] <= '9') {
            if (scale > 0) {
                micros += (data[pos] - '0') * scale;
                scale /= 10;
            }
            ++pos;
            ++frac_digits;
        }
        if (frac_digits == 0) return std::nullopt;
    }

    // Zone designator
    int64_t offset_seconds = 0;
    if (pos < len && (data[pos] == '+' || data[pos] == '-')) {
        int sign = data[pos] == '-' ? -1 : 1;
        pos++;
        int off_h = parse_int_fast(data, len, pos, digits);
        if (digits != 2) return std::nullopt;
        int off_m = 0;
        if (pos < len && data[pos] == ':') {
            pos++;
            off_m = parse_int_fast(data, len, pos, digits);
            if (digits != 2) return std::nullopt;
        }
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
    }
    if (pos < len && data[pos] == 'Z') {
        pos++;
    }
    if (pos != len) {
        return std::nullopt;
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    return seconds * kMicrosPerSecond + micros;
}

/**
 * Format microseconds since Unix epoch as RFC3339 UTC.
 * "YYYY-MM-DDTHH:MM:SSZ", or with ".ffffff" when there is a fractional part.
 */
inline std::string to_rfc3339_utc(int64_t timestamp_us) {
    int64_t seconds = timestamp_us / kMicrosPerSecond;
    int64_t micros = timestamp_us % kMicrosPerSecond;
    if (micros < 0) {
        micros += kMicrosPerSecond;
        seconds -= 1;
    }

    time_t t = static_cast<time_t>(seconds);
    std::tm tm = {};
    gmtime_r(&t, &tm);

    char buffer[40];
    if (micros == 0) {
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return std::string(buffer);
    }
    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buffer, sizeof(buffer), "%s.%06lldZ", base, static_cast<long long>(micros));
    return std::string(buffer);
}

} // namespace time_utils
} // namespace playledger
