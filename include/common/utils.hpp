#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <unistd.h>

namespace utils {

using TimePoint = std::chrono::system_clock::time_point;

// Drop sub-second precision; every timestamp we persist has second resolution
inline TimePoint truncateToSeconds(TimePoint tp) {
    return std::chrono::system_clock::from_time_t(std::chrono::system_clock::to_time_t(tp));
}

// strftime over the UTC breakdown of tp
inline std::string formatUtc(TimePoint tp, const char* format) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    size_t len = std::strftime(buf, sizeof(buf), format, &tm);
    return std::string(buf, len);
}

inline std::string formatIso8601(TimePoint tp) {
    return formatUtc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

// Accepts "YYYY-MM-DDTHH:MM:SS" with an optional trailing 'Z'; always read as UTC
inline bool parseIso8601(const std::string& str, TimePoint& out) {
    std::tm tm{};
    const char* end = strptime(str.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (!end) {
        return false;
    }
    if (*end == 'Z') {
        ++end;
    }
    if (*end != '\0') {
        return false;
    }
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(t);
    return true;
}

// Compact form used in archive filenames
inline std::string formatFileTimestamp(TimePoint tp) {
    return formatUtc(tp, "%Y%m%d_%H%M%S");
}

inline std::string getHostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    std::string host(buf);
    // Only the short name; dots and slashes have no place in a filename
    auto dot = host.find('.');
    if (dot != std::string::npos && dot > 0) {
        host.resize(dot);
    }
    for (auto& c : host) {
        if (c == '/' || c == '_') {
            c = '-';
        }
    }
    return host;
}

} // namespace utils
