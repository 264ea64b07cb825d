#include <sys/epoll.h>
#include <unistd.h>

#include <climits>
#include <cstdint>

#include "../src/core/reactor.hpp"
#include "../src/core/time_utils.hpp"

int main() {
    const uint64_t ms = 1000000ULL;
    uint64_t now = gwmon::monotonic_ns();
    if (gwmon::remaining_ms(now) != 0) return 1;
    if (gwmon::remaining_ms(now - ms) != 0) return 2;
    int left = gwmon::remaining_ms(now + 1500 * ms);
    if (left <= 0 || left > 1500) return 3;
    // Thirty days does not fit in an int of milliseconds.
    uint64_t month = 30ULL * 24 * 3600 * 1000 * ms;
    if (gwmon::remaining_ms(gwmon::monotonic_ns() + month) != INT_MAX) return 4;

    // A far deadline still waits rather than returning at once.
    int fds[2];
    if (::pipe(fds) != 0) return 5;
    if (::write(fds[1], "x", 1) != 1) return 6;
    gwmon::Reactor reactor;
    bool ready = false;
    if (!reactor.add_fd(fds[0], EPOLLIN, [&](uint32_t) { ready = true; })) return 7;
    bool done = reactor.wait_until(gwmon::monotonic_ns() + month, [&]() { return ready; });
    reactor.del_fd(fds[0]);
    ::close(fds[0]);
    ::close(fds[1]);
    if (!done) return 8;
    return 0;
}
