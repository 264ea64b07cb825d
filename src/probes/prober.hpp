#pragma once
#include <string>

#include "../core/outcome.hpp"
#include "icmp_probe.hpp"
#include "web_probe.hpp"

namespace gwmon {
class Prober {
   public:
    virtual ~Prober() = default;
    // Good when every echo came back, Fail when none did, Warn in between.
    virtual Outcome ping(const std::string& address, int repetitions, int timeout_ms) = 0;
    // Good only for an HTTP 200 response.
    virtual Outcome web(const std::string& url, int timeout_ms) = 0;
};

class NetProber : public Prober {
   public:
    Outcome ping(const std::string& address, int repetitions, int timeout_ms) override;
    Outcome web(const std::string& url, int timeout_ms) override;

   private:
    IcmpPinger pinger_;
    WebProbe web_;
};

inline bool is_web_address(const std::string& address) {
    return address.rfind("http://", 0) == 0 || address.rfind("https://", 0) == 0;
}
}  // namespace gwmon
