#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace gwmon {
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

inline bool parse_level(const std::string& s, LogLevel& out) {
    if (s == "debug") out = LogLevel::DEBUG;
    else if (s == "info") out = LogLevel::INFO;
    else if (s == "warn") out = LogLevel::WARN;
    else if (s == "error") out = LogLevel::ERROR;
    else return false;
    return true;
}

inline LogLevel& min_log_level() {
    static LogLevel lvl = LogLevel::INFO;
    return lvl;
}

inline void set_log_level(LogLevel lvl) { min_log_level() = lvl; }

inline void log(LogLevel lvl, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(min_log_level())) return;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    std::fprintf(stderr, "[%s] %s: %s\n", buf, level_name(lvl), msg.c_str());
}
}  // namespace gwmon
