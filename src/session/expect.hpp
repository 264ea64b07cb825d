#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "terminal.hpp"

namespace gwmon {
enum class ExpectStatus { Matched, Timeout, Eof };

struct ExpectResult {
    ExpectStatus status{ExpectStatus::Timeout};
    size_t index{0};     // into the pattern list, valid when Matched
    std::string before;  // output preceding the match, or everything unmatched
};

// Accumulates a Terminal's output and waits for the earliest occurrence of
// any of a set of literal patterns. Text up to the end of a match is
// consumed; the remainder carries over to the next expect().
class Expecter {
   public:
    explicit Expecter(Terminal& term) : term_(term) {}
    ExpectResult expect(const std::vector<std::string>& patterns,
                        std::chrono::milliseconds timeout);
    void clear() { buffer_.clear(); }
    const std::string& buffer() const { return buffer_; }

    static constexpr size_t kMaxBuffer = 64 * 1024;

   private:
    Terminal& term_;
    std::string buffer_;
    bool search(const std::vector<std::string>& patterns, ExpectResult& res);
};
}  // namespace gwmon
