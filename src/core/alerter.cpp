#include "alerter.hpp"

#include <thread>

namespace gwmon {
void BellAlerter::alert(int pulses) {
    if (quiet_) return;
    for (int i = 0; i < pulses; ++i) {
        out_ << '\a' << std::flush;
        std::this_thread::sleep_for(gap_);
    }
}
}  // namespace gwmon
