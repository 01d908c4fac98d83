#pragma once

#include <string>
#include <unordered_map>

namespace kalibox::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void Configure(const LogConfig& config);
bool IsEnabled(LogLevel level);

// Writes "[tag] message key=value ..." to stderr when level passes the filter.
void Log(const LogMessage& message);

inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    Log(LogMessage{level, tag, message, {}});
}

inline void Debug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void Info(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void Warn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void Error(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace kalibox::utils
