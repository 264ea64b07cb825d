#include "expect.hpp"

#include "../core/time_utils.hpp"

namespace gwmon {
bool Expecter::search(const std::vector<std::string>& patterns, ExpectResult& res) {
    size_t best_pos = std::string::npos;
    size_t best_idx = 0;
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (patterns[i].empty()) continue;
        size_t pos = buffer_.find(patterns[i]);
        // Earliest start wins; ties go to the first listed pattern.
        if (pos != std::string::npos && (best_pos == std::string::npos || pos < best_pos)) {
            best_pos = pos;
            best_idx = i;
        }
    }
    if (best_pos == std::string::npos) return false;
    res.status = ExpectStatus::Matched;
    res.index = best_idx;
    res.before = buffer_.substr(0, best_pos);
    buffer_.erase(0, best_pos + patterns[best_idx].size());
    return true;
}

ExpectResult Expecter::expect(const std::vector<std::string>& patterns,
                              std::chrono::milliseconds timeout) {
    ExpectResult res;
    if (search(patterns, res)) return res;
    uint64_t deadline =
        monotonic_ns() + static_cast<uint64_t>(timeout.count() > 0 ? timeout.count() : 0) *
                             1000000ULL;
    while (true) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            res.status = ExpectStatus::Timeout;
            break;
        }
        ReadStatus st = term_.read_some(buffer_, left);
        if (buffer_.size() > kMaxBuffer) buffer_.erase(0, buffer_.size() - kMaxBuffer);
        if (search(patterns, res)) return res;
        if (st == ReadStatus::Eof) {
            res.status = ExpectStatus::Eof;
            break;
        }
        if (st == ReadStatus::Timeout) {
            res.status = ExpectStatus::Timeout;
            break;
        }
    }
    res.before = buffer_;
    return res;
}
}  // namespace gwmon
