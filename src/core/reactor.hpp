#pragma once
#include <cstdint>
#include <functional>
#include <unordered_map>

#include "fd.hpp"

namespace gwmon {
using FdHandler = std::function<void(uint32_t)>;

// Small epoll wrapper. Callers drive it synchronously with loop_once() or
// wait_until() from a single thread.
class Reactor {
   public:
    Reactor();
    bool ok() const { return static_cast<bool>(epoll_fd_); }
    bool add_fd(int fd, uint32_t events, const FdHandler& cb);
    void del_fd(int fd);
    // Dispatches ready handlers; returns how many ran (0 on timeout).
    int loop_once(int timeout_ms);
    // Runs loop_once until done() holds or the monotonic deadline passes.
    // Returns done().
    bool wait_until(uint64_t deadline_ns, const std::function<bool()>& done);

   private:
    Fd epoll_fd_;
    std::unordered_map<int, FdHandler> handlers_;
};
}  // namespace gwmon
