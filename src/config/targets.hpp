#pragma once
#include <string>
#include <vector>

namespace gwmon {
struct Target {
    std::string address;
    std::string label;
};

struct TargetList {
    bool file_present{false};
    std::vector<Target> targets;  // file order, one entry per address
};

// address,label lines; extra fields are ignored. A repeated address keeps
// its first position and takes the later label. Throws ConfigError when the
// file exists but cannot be read or a line has no label field.
TargetList load_targets(const std::string& path);
}  // namespace gwmon
