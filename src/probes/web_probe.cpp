#include "web_probe.hpp"

#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>

#include "../core/fd.hpp"
#include "../core/logger.hpp"
#include "../core/reactor.hpp"
#include "../core/time_utils.hpp"

namespace gwmon {
bool parse_http_url(const std::string& url, HttpUrl& out) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) return false;
    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.path = slash == std::string::npos ? "/" : rest.substr(slash);
    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = "80";
    }
    return !out.host.empty() && !out.port.empty();
}

int WebProbe::get(const std::string& url, int timeout_ms) {
    HttpUrl u;
    if (!parse_http_url(url, u)) {
        if (url.rfind("https://", 0) == 0) {
            if (!warned_https_) log(LogLevel::WARN, "web probe: https is not supported: " + url);
            warned_https_ = true;
        } else {
            log(LogLevel::WARN, "web probe: bad url " + url);
        }
        return 0;
    }
    uint64_t deadline = monotonic_ns() + static_cast<uint64_t>(timeout_ms) * 1000000ULL;

    addrinfo hints{};
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_family = AF_UNSPEC;
    addrinfo* res = nullptr;
    if (::getaddrinfo(u.host.c_str(), u.port.c_str(), &hints, &res) != 0 || !res) {
        log(LogLevel::DEBUG, "web probe: dns failure for " + u.host);
        return 0;
    }
    Fd fd(::socket(res->ai_family, res->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                   res->ai_protocol));
    if (!fd) {
        ::freeaddrinfo(res);
        return 0;
    }
    int rc = ::connect(fd.get(), res->ai_addr, res->ai_addrlen);
    ::freeaddrinfo(res);
    if (rc < 0 && errno != EINPROGRESS) return 0;

    Reactor reactor;
    bool connected = false;
    bool failed = false;
    bool watching = reactor.add_fd(fd.get(), EPOLLOUT | EPOLLERR, [&](uint32_t) {
        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &len);
        if (err == 0) connected = true;
        else failed = true;
    });
    if (!watching) return 0;
    reactor.wait_until(deadline, [&]() { return connected || failed; });
    reactor.del_fd(fd.get());
    if (!connected) return 0;

    std::string req = "GET " + u.path + " HTTP/1.0\r\nHost: " + u.host +
                      "\r\nUser-Agent: gwmon\r\nConnection: close\r\n\r\n";
    if (!fd.write_all(req)) return 0;

    std::string head;
    bool done = false;
    watching = reactor.add_fd(fd.get(), EPOLLIN | EPOLLRDHUP, [&](uint32_t) {
        char buf[512];
        ssize_t n;
        while ((n = ::read(fd.get(), buf, sizeof(buf))) > 0) head.append(buf, n);
        if (n == 0 || (n < 0 && errno != EAGAIN && errno != EINTR)) done = true;
        if (head.find("\r\n") != std::string::npos) done = true;
    });
    if (!watching) return 0;
    reactor.wait_until(deadline, [&]() { return done; });
    reactor.del_fd(fd.get());

    // HTTP/1.x 200 OK
    auto eol = head.find("\r\n");
    std::string status_line = head.substr(0, eol);
    auto sp = status_line.find(' ');
    if (status_line.rfind("HTTP/", 0) != 0 || sp == std::string::npos) return 0;
    return std::atoi(status_line.c_str() + sp + 1);
}
}  // namespace gwmon
