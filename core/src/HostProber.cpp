// HostProber.cpp: TCP connect probing and neighbour lookups
#include "cw/HostProber.hpp"
#include "cw/Log.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace cw {

namespace {

// Closes the descriptor on scope exit
struct FdGuard {
    int fd;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() {
        if (fd >= 0)
            ::close(fd);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

} // namespace

PosixHostProber::PosixHostProber(std::string arpTablePath)
    : arpTablePath_(std::move(arpTablePath)) {}

bool PosixHostProber::isPortOpen(const std::string& ip, std::uint16_t port,
                                 std::chrono::milliseconds timeout) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
        return false;

    FdGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (sock.fd < 0) {
        log(LogLevel::Debug, "socket() failed: %s", std::strerror(errno));
        return false;
    }

    int rc = ::connect(sock.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc == 0)
        return true;
    if (errno != EINPROGRESS)
        return false;

    pollfd pfd{};
    pfd.fd = sock.fd;
    pfd.events = POLLOUT;
    rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc <= 0)
        return false;

    int soError = 0;
    socklen_t len = sizeof(soError);
    if (::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0)
        return false;
    return soError == 0;
}

std::optional<std::string> PosixHostProber::reverseName(const std::string& ip) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
        return std::nullopt;
    char host[NI_MAXHOST];
    int rc = ::getnameinfo(reinterpret_cast<sockaddr*>(&addr), sizeof(addr), host, sizeof(host),
                           nullptr, 0, NI_NAMEREQD);
    if (rc != 0)
        return std::nullopt;
    return std::string(host);
}

std::optional<std::string> PosixHostProber::hardwareAddress(const std::string& ip) {
    // IP address  HW type  Flags  HW address  Mask  Device
    std::ifstream table(arpTablePath_);
    if (!table)
        return std::nullopt;
    std::string line;
    std::getline(table, line); // header
    while (std::getline(table, line)) {
        std::istringstream fields(line);
        std::string addr, hwType, flags, mac;
        if (!(fields >> addr >> hwType >> flags >> mac))
            continue;
        if (addr != ip)
            continue;
        if (mac == "00:00:00:00:00:00")
            return std::nullopt;
        return mac;
    }
    return std::nullopt;
}

std::optional<std::string> PosixHostProber::primaryAddress() {
    // A connected UDP socket reveals the source address without sending anything
    FdGuard sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (sock.fd < 0)
        return std::nullopt;
    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);
    if (::connect(sock.fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) != 0)
        return std::nullopt;
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (::getsockname(sock.fd, reinterpret_cast<sockaddr*>(&local), &len) != 0)
        return std::nullopt;
    char buf[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)))
        return std::nullopt;
    return std::string(buf);
}

} // namespace cw
