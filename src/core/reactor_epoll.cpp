#include <sys/epoll.h>
#include <unistd.h>

#include <cerrno>

#include "logger.hpp"
#include "reactor.hpp"
#include "time_utils.hpp"

namespace gwmon {
Reactor::Reactor() : epoll_fd_(::epoll_create1(EPOLL_CLOEXEC)) {
    if (!epoll_fd_) log(LogLevel::ERROR, "epoll_create1 failed");
}

bool Reactor::add_fd(int fd, uint32_t events, const FdHandler& cb) {
    struct epoll_event ev {};
    ev.events = events;
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &ev) < 0) return false;
    handlers_[fd] = cb;
    return true;
}

void Reactor::del_fd(int fd) {
    ::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr);
    handlers_.erase(fd);
}

int Reactor::loop_once(int timeout_ms) {
    struct epoll_event evs[8];
    int n = ::epoll_wait(epoll_fd_.get(), evs, 8, timeout_ms);
    if (n < 0) {
        if (errno != EINTR) log(LogLevel::ERROR, "epoll_wait failed");
        return 0;
    }
    int ran = 0;
    for (int i = 0; i < n; ++i) {
        auto it = handlers_.find(evs[i].data.fd);
        if (it == handlers_.end()) continue;
        // Copy: the handler may del_fd() itself.
        FdHandler cb = it->second;
        cb(evs[i].events);
        ++ran;
    }
    return ran;
}

bool Reactor::wait_until(uint64_t deadline_ns, const std::function<bool()>& done) {
    while (!done()) {
        int left = remaining_ms(deadline_ns);
        if (left <= 0) return done();
        loop_once(left);
    }
    return true;
}
}  // namespace gwmon
