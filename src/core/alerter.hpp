#pragma once
#include <chrono>
#include <ostream>

namespace gwmon {
class Alerter {
   public:
    virtual ~Alerter() = default;
    virtual void alert(int pulses) = 0;
};

// Rings the terminal bell `pulses` times in quick succession.
class BellAlerter : public Alerter {
   public:
    BellAlerter(std::ostream& out, bool quiet,
                std::chrono::milliseconds gap = std::chrono::milliseconds(300))
        : out_(out), quiet_(quiet), gap_(gap) {}
    void alert(int pulses) override;

   private:
    std::ostream& out_;
    bool quiet_;
    std::chrono::milliseconds gap_;
};
}  // namespace gwmon
