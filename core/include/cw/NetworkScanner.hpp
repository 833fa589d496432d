#pragma once

#include "cw/HostProber.hpp"
#include "cw/Ipv4Range.hpp"
#include "cw/ProfileCatalog.hpp"
#include "cw/Types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw {

struct ScanOptions {
    std::chrono::milliseconds timeout{500};
    std::size_t concurrency = 256;
    std::vector<std::uint16_t> quickPorts = {554, 80, 8080};
    std::vector<std::uint16_t> ports = {80, 443, 554, 8080, 8554, 8000, 8899, 37777, 34567};
    bool resolveNames = true;
    bool resolveHardware = true;
};

// (scanned, total, currentAddress); calls are serialized
using ScanProgress = std::function<void(std::size_t, std::size_t, const std::string&)>;

// Sweeps an address range for hosts exposing camera-related ports
class NetworkScanner {
public:
    NetworkScanner(std::shared_ptr<HostProber> prober, const ProfileCatalog& catalog,
                   ScanOptions options = {});

    // Throws std::invalid_argument (from Ipv4Range::parse) on bad input.
    // Setting *stop aborts between hosts; partial results are returned.
    std::vector<DeviceRecord> scan(const std::string& range, ScanProgress progress = nullptr,
                                   const std::atomic<bool>* stop = nullptr);
    std::vector<DeviceRecord> scan(const Ipv4Range& range, ScanProgress progress = nullptr,
                                   const std::atomic<bool>* stop = nullptr);

    // nullopt when no quick port answers
    std::optional<DeviceRecord> scanHost(const std::string& ip);

    // Local /24 derived from the primary outbound interface, e.g. "192.168.1.0/24"
    static std::optional<std::string> localNetwork();
    static DeviceType classify(const std::set<std::uint16_t>& openPorts);

    const ScanOptions& options() const { return options_; }

private:
    std::shared_ptr<HostProber> prober_;
    const ProfileCatalog& catalog_;
    ScanOptions options_;
};

} // namespace cw
