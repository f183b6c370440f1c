#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace mpc::util {

inline std::string timestampToString(const std::chrono::system_clock::time_point tp) {
    const std::time_t ts = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string getCurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

} // namespace mpc::util
