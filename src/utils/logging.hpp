#pragma once

#include <iostream>
#include <map>
#include <mutex>
#include <string>

namespace codebox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    if (value == "debug" || value == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (value == "info" || value == "INFO") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "WARN" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error" || value == "ERROR") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Renders "[tag] LEVEL message key=value ..." as one line.
inline std::string Format(const LogMessage& msg) {
    std::string line = "[" + msg.tag + "] " + ToString(msg.level) + " " + msg.message;
    for (const auto& [key, value] : msg.fields) {
        line += " " + key + "=" + value;
    }
    return line;
}

inline void Log(const LogConfig& config, const LogMessage& msg) {
    if (static_cast<int>(msg.level) < static_cast<int>(config.min_level)) {
        return;
    }
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    std::cerr << Format(msg) << std::endl;
}

}  // namespace codebox::utils
