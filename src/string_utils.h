#pragma once

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdio>

/**
 * String helpers shared by the loaders, config and CLI.
 */
namespace playledger {
namespace string_utils {

/**
 * Check if a string ends with a given suffix.
 * Example: ends_with("plays.csv.gz", ".gz") returns true
 */
inline bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.size() < suffix.size()) {
        return false;
    }
    return std::equal(suffix.begin(), suffix.end(), str.end() - suffix.size());
}

inline bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), str.begin());
}

/**
 * Check if a string is an optionally signed run of digits.
 * Used to decide whether a raw CSV/JSON value is an integer.
 */
inline bool is_integer(const std::string& str) {
    size_t start = (!str.empty() && (str[0] == '-' || str[0] == '+')) ? 1 : 0;
    if (start >= str.size()) {
        return false;
    }
    for (size_t i = start; i < str.size(); ++i) {
        if (str[i] < '0' || str[i] > '9') {
            return false;
        }
    }
    return true;
}

inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

inline std::string trim(const std::string& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(begin, end - begin);
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * Escape a string for JSON output.
 * Handles: quotes, backslashes, control characters, etc.
 */
inline std::string json_escape(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 8);

    for (unsigned char uc : str) {
        char c = static_cast<char>(uc);
        switch (c) {
            case '\"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (uc < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

} // namespace string_utils
} // namespace playledger
