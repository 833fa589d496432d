#include "cw/Types.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <map>

namespace cw {

const char* toString(ConnectionKind kind) {
    switch (kind) {
        case ConnectionKind::Stream: return "rtsp";
        case ConnectionKind::HttpImage: return "http_mjpeg";
        case ConnectionKind::Snapshot: return "snapshot";
    }
    return "rtsp";
}

const char* toString(ProbeMethod method) {
    switch (method) {
        case ProbeMethod::Onvif: return "onvif";
        case ProbeMethod::Stream: return "rtsp";
        case ProbeMethod::Http: return "http";
    }
    return "rtsp";
}

const char* toString(HealthTier tier) {
    switch (tier) {
        case HealthTier::Unknown: return "unknown";
        case HealthTier::Excellent: return "excellent";
        case HealthTier::Good: return "good";
        case HealthTier::Fair: return "fair";
        case HealthTier::Poor: return "poor";
        case HealthTier::Offline: return "offline";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Unreachable: return "unreachable";
        case ErrorKind::ProtocolMismatch: return "protocol_mismatch";
        case ErrorKind::AuthenticationRequired: return "authentication_required";
        case ErrorKind::DecodeFailure: return "decode_failure";
        case ErrorKind::ExhaustedRetries: return "exhausted_retries";
    }
    return "none";
}

const char* toString(DeviceType type) {
    switch (type) {
        case DeviceType::Unknown: return "unknown";
        case DeviceType::Camera: return "camera";
        case DeviceType::Nvr: return "nvr";
    }
    return "unknown";
}

std::optional<ConnectionKind> parseConnectionKind(const std::string& name) {
    if (name == "rtsp" || name == "stream") return ConnectionKind::Stream;
    if (name == "http_mjpeg" || name == "http" || name == "mjpeg") return ConnectionKind::HttpImage;
    if (name == "snapshot") return ConnectionKind::Snapshot;
    return std::nullopt;
}

std::optional<HealthTier> parseHealthTier(const std::string& name) {
    static const std::map<std::string, HealthTier> tiers = {
        {"unknown", HealthTier::Unknown},
        {"excellent", HealthTier::Excellent},
        {"good", HealthTier::Good},
        {"fair", HealthTier::Fair},
        {"poor", HealthTier::Poor},
        {"offline", HealthTier::Offline},
    };
    auto it = tiers.find(name);
    if (it == tiers.end())
        return std::nullopt;
    return it->second;
}

HealthTier healthTierFor(bool online, double latencyMs) {
    if (!online)
        return HealthTier::Offline;
    if (latencyMs < 500.0)
        return HealthTier::Excellent;
    if (latencyMs < 1500.0)
        return HealthTier::Good;
    if (latencyMs < 3000.0)
        return HealthTier::Fair;
    return HealthTier::Poor;
}

std::string Resolution::toString() const {
    return std::to_string(width) + "x" + std::to_string(height);
}

namespace {

template <typename T>
void fillIfEmpty(std::optional<T>& target, const std::optional<T>& other) {
    if (!target && other)
        target = other;
}

std::uint32_t ipKey(const std::string& ip) {
    in_addr addr{};
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
        return 0xFFFFFFFFu;
    return ntohl(addr.s_addr);
}

} // namespace

void mergeInto(DeviceRecord& target, const DeviceRecord& other) {
    fillIfEmpty(target.hostname, other.hostname);
    fillIfEmpty(target.mac, other.mac);
    fillIfEmpty(target.vendor, other.vendor);
    fillIfEmpty(target.name, other.name);
    fillIfEmpty(target.model, other.model);
    fillIfEmpty(target.firmware, other.firmware);
    fillIfEmpty(target.hardwareId, other.hardwareId);
    fillIfEmpty(target.serviceAddress, other.serviceAddress);
    fillIfEmpty(target.resolution, other.resolution);
    if (target.servicePort == 0)
        target.servicePort = other.servicePort;
    if (target.type == DeviceType::Unknown)
        target.type = other.type;
    target.viaDiscovery = target.viaDiscovery || other.viaDiscovery;
    target.openPorts.insert(other.openPorts.begin(), other.openPorts.end());
    for (const auto& scope : other.scopes) {
        if (std::find(target.scopes.begin(), target.scopes.end(), scope) == target.scopes.end())
            target.scopes.push_back(scope);
    }
    for (const auto& url : other.streamUrls) {
        if (std::find(target.streamUrls.begin(), target.streamUrls.end(), url) == target.streamUrls.end())
            target.streamUrls.push_back(url);
    }
}

std::vector<DeviceRecord> mergeDeviceRecords(std::vector<DeviceRecord> records) {
    std::vector<DeviceRecord> merged;
    std::map<std::string, size_t> byAddress;
    for (auto& record : records) {
        auto it = byAddress.find(record.ip);
        if (it == byAddress.end()) {
            byAddress.emplace(record.ip, merged.size());
            merged.push_back(std::move(record));
        } else {
            mergeInto(merged[it->second], record);
        }
    }
    std::stable_sort(merged.begin(), merged.end(), [](const DeviceRecord& a, const DeviceRecord& b) {
        return ipKey(a.ip) < ipKey(b.ip);
    });
    return merged;
}

} // namespace cw
