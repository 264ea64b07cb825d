#pragma once
#include <sys/types.h>

#include <string>
#include <vector>

#include "../core/fd.hpp"
#include "../core/reactor.hpp"
#include "terminal.hpp"

namespace gwmon {
// Child process on a pseudo-terminal (forkpty). Echo is turned off in the
// child so that sent lines never show up in the matched output.
class PtyTerminal : public Terminal {
   public:
    PtyTerminal() = default;
    ~PtyTerminal() override;
    PtyTerminal(const PtyTerminal&) = delete;
    PtyTerminal& operator=(const PtyTerminal&) = delete;

    bool kill_strays(const std::vector<std::string>& names) override;
    bool spawn(const std::vector<std::string>& argv, const std::vector<std::string>& env) override;
    bool send_line(const std::string& line) override;
    ReadStatus read_some(std::string& out, int timeout_ms) override;
    bool alive() override;
    bool terminate() override;

   private:
    pid_t pid_{-1};
    Fd master_;
    Reactor reactor_;
    std::string pending_;
    bool eof_{false};
    void on_readable();
    void close_master();
};
}  // namespace gwmon
