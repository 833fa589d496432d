#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace cw {

// Low-level host reachability primitives used by the scanner
class HostProber {
public:
    virtual ~HostProber() = default;

    virtual bool isPortOpen(const std::string& ip, std::uint16_t port,
                            std::chrono::milliseconds timeout) = 0;
    virtual std::optional<std::string> reverseName(const std::string& ip) = 0;
    virtual std::optional<std::string> hardwareAddress(const std::string& ip) = 0;
};

// Linux implementation: non-blocking connect + poll, getnameinfo and the
// kernel neighbour table
class PosixHostProber : public HostProber {
public:
    explicit PosixHostProber(std::string arpTablePath = "/proc/net/arp");

    bool isPortOpen(const std::string& ip, std::uint16_t port,
                    std::chrono::milliseconds timeout) override;
    std::optional<std::string> reverseName(const std::string& ip) override;
    std::optional<std::string> hardwareAddress(const std::string& ip) override;

    // Address of the interface used for outbound traffic, if any
    static std::optional<std::string> primaryAddress();

private:
    std::string arpTablePath_;
};

} // namespace cw
