#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

#include "utils/common.hpp"

namespace heartcore::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config{};

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_config = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_config;
}

bool IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return static_cast<int>(level) >= static_cast<int>(g_log_config.min_level);
}

void Write(const LogMessage& msg) {
    std::ostringstream line;
    line << FormatLocalTime(Now(), "%Y-%m-%dT%H:%M:%S")
         << " " << ToString(msg.level)
         << " [" << msg.tag << "] " << msg.message;
    // fields in key order
    const std::map<std::string, std::string> ordered(msg.fields.begin(), msg.fields.end());
    for (const auto& [key, value] : ordered) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace heartcore::utils
