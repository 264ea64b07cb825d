#pragma once
#include <signal.h>

#include <chrono>

#include "fd.hpp"
#include "reactor.hpp"

namespace gwmon {
// Checkpoint-style view of an external termination request.
class ShutdownWatch {
   public:
    virtual ~ShutdownWatch() = default;
    virtual bool requested() = 0;
    // Sleeps for d. Returns false if a request arrived first.
    virtual bool sleep_for(std::chrono::seconds d) = 0;
};

// Blocks SIGINT/SIGTERM for the process and reads them from a signalfd, so
// cleanup runs on the main thread instead of in a signal handler.
class SignalShutdownWatch : public ShutdownWatch {
   public:
    SignalShutdownWatch();
    ~SignalShutdownWatch() override;
    SignalShutdownWatch(const SignalShutdownWatch&) = delete;
    SignalShutdownWatch& operator=(const SignalShutdownWatch&) = delete;

    bool requested() override;
    bool sleep_for(std::chrono::seconds d) override;
    int signal_number() const { return signo_; }

   private:
    Reactor reactor_;
    Fd sfd_;
    sigset_t old_mask_{};
    bool requested_{false};
    int signo_{0};
    void drain();
};
}  // namespace gwmon
