#pragma once
#include <chrono>
#include <climits>
#include <cstdint>
#include <ctime>
#include <string>

namespace gwmon {
inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

inline int remaining_ms(uint64_t deadline_ns) {
    uint64_t now = monotonic_ns();
    if (now >= deadline_ns) return 0;
    uint64_t ms = (deadline_ns - now + 999999) / 1000000;
    // Callers wait in a loop until the deadline, so a capped slice is enough.
    return ms > static_cast<uint64_t>(INT_MAX) ? INT_MAX : static_cast<int>(ms);
}

struct DateTod {
    std::string date;  // YYYY/MM/DD
    std::string tod;   // HH:MM:SS
};

// Local wall-clock date and time of day, the form used in result rows.
inline DateTod date_and_tod() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char d[16];
    char h[16];
    std::strftime(d, sizeof(d), "%Y/%m/%d", &tm);
    std::strftime(h, sizeof(h), "%H:%M:%S", &tm);
    return {d, h};
}
}  // namespace gwmon
