// NetworkScanner.cpp: parallel port sweep over an IPv4 range
#include "cw/NetworkScanner.hpp"
#include "cw/Log.hpp"
#include "cw/WorkerPool.hpp"

#include <algorithm>
#include <mutex>

namespace cw {

NetworkScanner::NetworkScanner(std::shared_ptr<HostProber> prober, const ProfileCatalog& catalog,
                               ScanOptions options)
    : prober_(std::move(prober)), catalog_(catalog), options_(std::move(options)) {}

DeviceType NetworkScanner::classify(const std::set<std::uint16_t>& openPorts) {
    if (openPorts.count(554) || openPorts.count(8554))
        return DeviceType::Camera;
    if (openPorts.count(37777) || openPorts.count(8000))
        return DeviceType::Nvr;
    return DeviceType::Unknown;
}

std::optional<std::string> NetworkScanner::localNetwork() {
    auto local = PosixHostProber::primaryAddress();
    if (!local)
        return std::nullopt;
    std::uint32_t addr = 0;
    if (!parseIpv4(*local, addr))
        return std::nullopt;
    return formatIpv4(addr & 0xFFFFFF00u) + "/24";
}

std::optional<DeviceRecord> NetworkScanner::scanHost(const std::string& ip) {
    std::set<std::uint16_t> open;
    for (auto port : options_.quickPorts) {
        if (prober_->isPortOpen(ip, port, options_.timeout)) {
            open.insert(port);
            break;
        }
    }
    if (open.empty())
        return std::nullopt;

    for (auto port : options_.ports) {
        if (open.count(port))
            continue;
        if (prober_->isPortOpen(ip, port, options_.timeout))
            open.insert(port);
    }

    DeviceRecord record;
    record.ip = ip;
    record.openPorts = std::move(open);
    record.type = classify(record.openPorts);
    if (options_.resolveNames)
        record.hostname = prober_->reverseName(ip);
    if (options_.resolveHardware) {
        record.mac = prober_->hardwareAddress(ip);
        if (record.mac)
            record.vendor = catalog_.detectVendorFromMac(*record.mac);
    }
    return record;
}

std::vector<DeviceRecord> NetworkScanner::scan(const std::string& range, ScanProgress progress,
                                               const std::atomic<bool>* stop) {
    return scan(Ipv4Range::parse(range), std::move(progress), stop);
}

std::vector<DeviceRecord> NetworkScanner::scan(const Ipv4Range& range, ScanProgress progress,
                                               const std::atomic<bool>* stop) {
    const auto hosts = range.hosts();
    const std::size_t total = hosts.size();
    log(LogLevel::Info, "Scanning %s (%zu hosts, %zu workers)", range.toString().c_str(), total,
        options_.concurrency);

    std::vector<DeviceRecord> found;
    std::mutex resultsMutex;
    std::mutex progressMutex;
    std::size_t scanned = 0;

    {
        WorkerPool pool(std::min(options_.concurrency, total));
        for (const auto& ip : hosts) {
            pool.submit([&, ip] {
                if (stop && stop->load())
                    return;
                std::optional<DeviceRecord> record;
                try {
                    record = scanHost(ip);
                } catch (const std::exception& e) {
                    log(LogLevel::Debug, "Probe of %s failed: %s", ip.c_str(), e.what());
                }
                if (record) {
                    log(LogLevel::Debug, "Found host %s (%zu open ports)", ip.c_str(),
                        record->openPorts.size());
                    std::lock_guard<std::mutex> lock(resultsMutex);
                    found.push_back(std::move(*record));
                }
                std::lock_guard<std::mutex> lock(progressMutex);
                ++scanned;
                if (progress)
                    progress(scanned, total, ip);
            });
        }
        pool.wait();
    }

    if (stop && stop->load())
        log(LogLevel::Info, "Scan stopped after %zu of %zu hosts", scanned, total);
    log(LogLevel::Info, "Scan complete: %zu devices found", found.size());
    return mergeDeviceRecords(std::move(found));
}

} // namespace cw
