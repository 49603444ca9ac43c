#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

namespace codebox::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string Truncate(const std::string& value, std::size_t max_chars) {
    if (value.size() <= max_chars) {
        return value;
    }
    return value.substr(0, max_chars);
}

// Counts UTF-8 code points; continuation bytes are skipped.
inline std::size_t Utf8Length(const std::string& value) {
    std::size_t count = 0;
    for (unsigned char c : value) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

inline std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, static_cast<int>(millis));
    return result;
}

}  // namespace codebox::utils
