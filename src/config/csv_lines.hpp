#pragma once
#include <cctype>
#include <string>
#include <vector>

namespace gwmon {
inline std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

inline std::vector<std::string> split_fields(const std::string& line, bool trimmed = true) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        std::string field = comma == std::string::npos ? line.substr(start)
                                                       : line.substr(start, comma - start);
        out.push_back(trimmed ? trim(field) : field);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

// Blank lines and '#' comments carry nothing.
inline bool is_skippable(const std::string& line) {
    std::string t = trim(line);
    return t.empty() || t[0] == '#';
}
}  // namespace gwmon
