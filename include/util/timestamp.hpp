#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace tandem::util {

// Origin-clock timestamps on the wire are milliseconds since the Unix epoch.
inline int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromMillis(const int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string millisToString(const int64_t ms) {
    return timestampToString(static_cast<std::time_t>(ms / 1000));
}

}
