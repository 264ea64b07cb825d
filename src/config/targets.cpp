#include "targets.hpp"

#include <filesystem>
#include <fstream>
#include <unordered_map>

#include "../core/errors.hpp"
#include "csv_lines.hpp"

namespace gwmon {
TargetList load_targets(const std::string& path) {
    TargetList out;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return out;
    out.file_present = true;

    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("failed to read targets file " + path);
    std::unordered_map<std::string, size_t> seen;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_skippable(line)) continue;
        auto fields = split_fields(line);
        if (fields.size() < 2 || fields[0].empty()) {
            throw ConfigError(path + ":" + std::to_string(lineno) + ": expected address,label");
        }
        auto it = seen.find(fields[0]);
        if (it != seen.end()) {
            out.targets[it->second].label = fields[1];
            continue;
        }
        seen.emplace(fields[0], out.targets.size());
        out.targets.push_back({fields[0], fields[1]});
    }
    if (in.bad()) throw ConfigError("failed to read targets file " + path);
    return out;
}
}  // namespace gwmon
