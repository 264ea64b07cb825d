#include "shutdown.hpp"

#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>

#include "errors.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace gwmon {
SignalShutdownWatch::SignalShutdownWatch() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (::sigprocmask(SIG_BLOCK, &mask, &old_mask_) < 0) {
        throw FatalError("sigprocmask failed");
    }
    sfd_.reset(::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC));
    if (!sfd_ || !reactor_.ok()) {
        ::sigprocmask(SIG_SETMASK, &old_mask_, nullptr);
        throw FatalError("cannot set up interrupt handling");
    }
    if (!reactor_.add_fd(sfd_.get(), EPOLLIN, [this](uint32_t) { drain(); })) {
        ::sigprocmask(SIG_SETMASK, &old_mask_, nullptr);
        throw FatalError("cannot watch for interrupts");
    }
}

SignalShutdownWatch::~SignalShutdownWatch() {
    reactor_.del_fd(sfd_.get());
    ::sigprocmask(SIG_SETMASK, &old_mask_, nullptr);
}

void SignalShutdownWatch::drain() {
    signalfd_siginfo si{};
    while (::read(sfd_.get(), &si, sizeof(si)) == static_cast<ssize_t>(sizeof(si))) {
        if (!requested_) {
            log(LogLevel::DEBUG, "received signal " + std::to_string(si.ssi_signo));
        }
        requested_ = true;
        signo_ = static_cast<int>(si.ssi_signo);
    }
}

bool SignalShutdownWatch::requested() {
    reactor_.loop_once(0);
    return requested_;
}

bool SignalShutdownWatch::sleep_for(std::chrono::seconds d) {
    if (d.count() <= 0) return !requested();
    uint64_t deadline =
        monotonic_ns() +
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count());
    reactor_.wait_until(deadline, [this]() { return requested_; });
    return !requested_;
}
}  // namespace gwmon
