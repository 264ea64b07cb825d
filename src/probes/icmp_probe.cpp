#include "icmp_probe.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "../core/logger.hpp"
#include "../core/reactor.hpp"
#include "../core/time_utils.hpp"

namespace gwmon {
namespace {
uint16_t csum(const uint16_t* data, size_t len) {
    uint32_t sum = 0;
    for (; len > 1; len -= 2) sum += *data++;
    if (len == 1) sum += *reinterpret_cast<const uint8_t*>(data);
    sum = (sum >> 16) + (sum & 0xFFFF);
    sum += (sum >> 16);
    return static_cast<uint16_t>(~sum);
}
}  // namespace

IcmpPinger::IcmpPinger() : ident_(static_cast<uint16_t>(::getpid() & 0xFFFF)) {}

Fd IcmpPinger::open_socket(bool& raw) {
    raw = false;
    Fd fd(::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_ICMP));
    if (!fd) {
        raw = true;
        fd.reset(::socket(AF_INET, SOCK_RAW | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_ICMP));
    }
    if (!fd && !warned_) {
        warned_ = true;
        log(LogLevel::WARN,
            "ICMP sockets unavailable; allow ping_group_range or grant CAP_NET_RAW");
    }
    return fd;
}

bool IcmpPinger::resolve(const std::string& host, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    if (::inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) return true;
    addrinfo hints{};
    hints.ai_family = AF_INET;
    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    out.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    ::freeaddrinfo(res);
    return true;
}

bool IcmpPinger::echo(const std::string& host, int timeout_ms) {
    sockaddr_in sa{};
    if (!resolve(host, sa)) {
        log(LogLevel::DEBUG, "ping: cannot resolve " + host);
        return false;
    }
    bool raw = false;
    Fd fd = open_socket(raw);
    if (!fd) return false;

    uint16_t seq = next_seq_++;
    icmphdr hdr{};
    hdr.type = ICMP_ECHO;
    hdr.code = 0;
    hdr.un.echo.id = htons(ident_);
    hdr.un.echo.sequence = htons(seq);
    hdr.checksum = csum(reinterpret_cast<uint16_t*>(&hdr), sizeof(hdr));
    ssize_t n = ::sendto(fd.get(), &hdr, sizeof(hdr), 0, reinterpret_cast<sockaddr*>(&sa),
                         sizeof(sa));
    if (n < 0) {
        log(LogLevel::DEBUG, "ping: sendto " + host + ": " + std::strerror(errno));
        return false;
    }

    bool replied = false;
    Reactor reactor;
    bool watching = reactor.add_fd(fd.get(), EPOLLIN, [&](uint32_t) {
        uint8_t buf[1500];
        sockaddr_in from{};
        socklen_t flen = sizeof(from);
        ssize_t got;
        while ((got = ::recvfrom(fd.get(), buf, sizeof(buf), 0,
                                 reinterpret_cast<sockaddr*>(&from), &flen)) > 0) {
            size_t off = 0;
            if (raw) {
                if (got < static_cast<ssize_t>(sizeof(iphdr))) continue;
                off = reinterpret_cast<iphdr*>(buf)->ihl * 4;
            }
            if (got < static_cast<ssize_t>(off + sizeof(icmphdr))) continue;
            auto* icmp = reinterpret_cast<icmphdr*>(buf + off);
            if (icmp->type != ICMP_ECHOREPLY) continue;
            if (ntohs(icmp->un.echo.sequence) != seq) continue;
            // Ping sockets rewrite the identifier; only raw replies can be checked.
            if (raw && ntohs(icmp->un.echo.id) != ident_) continue;
            if (from.sin_addr.s_addr != sa.sin_addr.s_addr) continue;
            replied = true;
            return;
        }
    });
    if (!watching) return false;
    reactor.wait_until(monotonic_ns() + static_cast<uint64_t>(timeout_ms) * 1000000ULL,
                       [&]() { return replied; });
    reactor.del_fd(fd.get());
    return replied;
}
}  // namespace gwmon
