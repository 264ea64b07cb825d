#pragma once
#include <netinet/in.h>

#include <cstdint>
#include <string>

#include "../core/fd.hpp"

namespace gwmon {
// Blocking ICMP echo. Prefers an unprivileged ping socket and falls back to
// a raw socket (needs CAP_NET_RAW).
class IcmpPinger {
   public:
    IcmpPinger();
    // One echo request; true when the matching reply arrives in time.
    bool echo(const std::string& host, int timeout_ms);

   private:
    uint16_t ident_;
    uint16_t next_seq_{1};
    bool warned_{false};

    Fd open_socket(bool& raw);
    static bool resolve(const std::string& host, sockaddr_in& out);
};
}  // namespace gwmon
