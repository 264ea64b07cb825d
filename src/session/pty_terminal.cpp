#include "pty_terminal.hpp"

#include <fcntl.h>
#include <pty.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

#include "../core/logger.hpp"
#include "../core/time_utils.hpp"

namespace gwmon {
namespace {
bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

[[noreturn]] void exec_child(const std::vector<std::string>& argv,
                             const std::vector<std::string>& env) {
    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);

    termios tio{};
    if (::tcgetattr(STDIN_FILENO, &tio) == 0) {
        tio.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
        ::tcsetattr(STDIN_FILENO, TCSANOW, &tio);
    }
    for (const auto& kv : env) ::putenv(const_cast<char*>(kv.c_str()));

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    ::execvp(args[0], args.data());
    ::_exit(127);
}
}  // namespace

PtyTerminal::~PtyTerminal() {
    if (pid_ > 0) terminate();
}

bool PtyTerminal::kill_strays(const std::vector<std::string>& names) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
        log(LogLevel::ERROR, "cannot read /proc: " + ec.message());
        return false;
    }
    bool ok = true;
    const pid_t self = ::getpid();
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (!all_digits(name)) continue;
        pid_t pid = static_cast<pid_t>(std::atoi(name.c_str()));
        if (pid == self) continue;
        std::ifstream comm(entry.path() / "comm");
        std::string cmd;
        if (!std::getline(comm, cmd)) continue;
        bool wanted = false;
        for (const auto& n : names) {
            // comm is truncated to 15 characters by the kernel
            if (cmd == n.substr(0, 15)) wanted = true;
        }
        if (!wanted) continue;
        if (::kill(pid, SIGKILL) < 0 && errno != ESRCH) {
            log(LogLevel::ERROR, "cannot kill " + cmd + " (pid " + name + "): " +
                                     std::strerror(errno));
            ok = false;
        } else {
            log(LogLevel::DEBUG, "killed stray " + cmd + " (pid " + name + ")");
        }
    }
    return ok;
}

bool PtyTerminal::spawn(const std::vector<std::string>& argv,
                        const std::vector<std::string>& env) {
    if (argv.empty()) return false;
    if (pid_ > 0) terminate();

    winsize ws{};
    ws.ws_row = 24;
    ws.ws_col = 200;
    int master = -1;
    pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
    if (pid < 0) {
        log(LogLevel::ERROR, std::string("forkpty failed: ") + std::strerror(errno));
        return false;
    }
    if (pid == 0) exec_child(argv, env);

    pid_ = pid;
    master_.reset(master);
    ::fcntl(master, F_SETFD, FD_CLOEXEC);
    master_.set_nonblock();
    pending_.clear();
    eof_ = false;
    if (!reactor_.add_fd(master, EPOLLIN, [this](uint32_t) { on_readable(); })) {
        log(LogLevel::ERROR, "cannot watch pty master");
        terminate();
        return false;
    }
    log(LogLevel::DEBUG, "spawned " + argv[0] + " as pid " + std::to_string(pid));
    return true;
}

void PtyTerminal::on_readable() {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(master_.get(), buf, sizeof(buf));
        if (n > 0) {
            pending_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno == EAGAIN) return;
        // 0, or EIO once the slave side has no more holders
        eof_ = true;
        reactor_.del_fd(master_.get());
        return;
    }
}

bool PtyTerminal::send_line(const std::string& line) {
    if (!master_) return false;
    return master_.write_all(line + "\r");
}

ReadStatus PtyTerminal::read_some(std::string& out, int timeout_ms) {
    if (pending_.empty() && !eof_ && master_) {
        uint64_t deadline = monotonic_ns() + static_cast<uint64_t>(timeout_ms) * 1000000ULL;
        reactor_.wait_until(deadline, [this]() { return !pending_.empty() || eof_; });
    }
    if (!pending_.empty()) {
        out += pending_;
        pending_.clear();
        return ReadStatus::Data;
    }
    return (eof_ || !master_) ? ReadStatus::Eof : ReadStatus::Timeout;
}

bool PtyTerminal::alive() {
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    pid_ = -1;
    close_master();
    return false;
}

void PtyTerminal::close_master() {
    if (master_) {
        reactor_.del_fd(master_.get());
        master_.reset();
    }
    pending_.clear();
    eof_ = false;
}

bool PtyTerminal::terminate() {
    bool ok = true;
    if (pid_ > 0) {
        // forkpty() made the child a session leader; take its group too.
        ::kill(-pid_, SIGKILL);
        if (::kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
            log(LogLevel::ERROR, std::string("kill failed: ") + std::strerror(errno));
            ok = false;
        }
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
    close_master();
    return ok;
}
}  // namespace gwmon
