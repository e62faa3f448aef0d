#pragma once

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>

namespace heartcore::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();
bool IsEnabled(LogLevel level);
void Write(const LogMessage& msg);

using LogFields = std::initializer_list<std::pair<const std::string, std::string>>;

inline void Log(LogLevel level, const std::string& tag, const std::string& message, LogFields fields = {}) {
    if (!IsEnabled(level)) {
        return;
    }
    Write(LogMessage{level, tag, message, std::unordered_map<std::string, std::string>(fields)});
}

inline void LogDebug(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log(LogLevel::kDebug, tag, message, fields);
}

inline void LogInfo(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log(LogLevel::kInfo, tag, message, fields);
}

inline void LogWarn(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log(LogLevel::kWarn, tag, message, fields);
}

inline void LogError(const std::string& tag, const std::string& message, LogFields fields = {}) {
    Log(LogLevel::kError, tag, message, fields);
}

}  // namespace heartcore::utils
