#pragma once

namespace gwmon {
enum class Outcome { Good, Warn, Fail };

inline const char* outcome_name(Outcome o) {
    switch (o) {
        case Outcome::Good: return "Good";
        case Outcome::Warn: return "Warn";
        case Outcome::Fail: return "Fail";
    }
    return "?";
}

// k repetitions with g successes. Warn needs k > 1 to be reachable.
inline Outcome classify(int repetitions, int successes) {
    if (successes >= repetitions) return Outcome::Good;
    if (successes <= 0) return Outcome::Fail;
    return Outcome::Warn;
}
}  // namespace gwmon
