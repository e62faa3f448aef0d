#pragma once

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

namespace heartcore::utils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

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

inline TimePoint Now() {
    return Clock::now();
}

inline std::string FormatLocalTime(TimePoint tp, const char* format) {
    const auto time = Clock::to_time_t(tp);
    std::tm local_time{};
#if defined(_WIN32)
    localtime_s(&local_time, &time);
#else
    localtime_r(&time, &local_time);
#endif
    char buffer[64];
    const auto written = std::strftime(buffer, sizeof(buffer), format, &local_time);
    return std::string(buffer, written);
}

// Calendar day in local time, "YYYY-MM-DD".
inline std::string LocalDate(TimePoint tp) {
    return FormatLocalTime(tp, "%Y-%m-%d");
}

inline double ToEpochSeconds(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

inline TimePoint FromEpochSeconds(double seconds) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds)));
}

inline double Clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

}  // namespace heartcore::utils
