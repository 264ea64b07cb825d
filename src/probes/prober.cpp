#include "prober.hpp"

namespace gwmon {
Outcome NetProber::ping(const std::string& address, int repetitions, int timeout_ms) {
    if (repetitions < 1) repetitions = 1;
    int good = 0;
    for (int i = 0; i < repetitions; ++i) {
        if (pinger_.echo(address, timeout_ms)) ++good;
    }
    return classify(repetitions, good);
}

Outcome NetProber::web(const std::string& url, int timeout_ms) {
    return web_.get(url, timeout_ms) == 200 ? Outcome::Good : Outcome::Fail;
}
}  // namespace gwmon
