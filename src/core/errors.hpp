#pragma once
#include <stdexcept>
#include <string>

namespace gwmon {
// Unusable parameter or target file. Raised before or between cycles.
class ConfigError : public std::runtime_error {
   public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// No safe continuation: the session could not guarantee exclusivity or
// start its shell, or the result log failed for a reason other than
// contention.
class FatalError : public std::runtime_error {
   public:
    explicit FatalError(const std::string& what) : std::runtime_error(what) {}
};
}  // namespace gwmon
