#pragma once

#include "cw/HttpClient.hpp"
#include "cw/ProfileCatalog.hpp"
#include "cw/Types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw {

struct Datagram {
    std::string payload;
    std::string sourceIp;
};

// Send side of the discovery exchange plus the replies it provokes
class DiscoveryTransport {
public:
    virtual ~DiscoveryTransport() = default;
    virtual bool send(const std::string& payload) = 0;
    // nullopt when nothing arrived within wait
    virtual std::optional<Datagram> receive(std::chrono::milliseconds wait) = 0;
};

// UDP socket sending to the WS-Discovery multicast group and receiving unicast replies
class UdpMulticastTransport : public DiscoveryTransport {
public:
    UdpMulticastTransport(std::string group, std::uint16_t port);
    ~UdpMulticastTransport() override;

    UdpMulticastTransport(const UdpMulticastTransport&) = delete;
    UdpMulticastTransport& operator=(const UdpMulticastTransport&) = delete;

    bool send(const std::string& payload) override;
    std::optional<Datagram> receive(std::chrono::milliseconds wait) override;

private:
    bool ensureSocket();

    std::string group_;
    std::uint16_t port_;
    int fd_ = -1;
};

using DiscoveryTransportFactory = std::function<std::unique_ptr<DiscoveryTransport>()>;

struct DiscoveryOptions {
    std::chrono::milliseconds timeout{3000};
    std::string multicastGroup = "239.255.255.250";
    std::uint16_t port = 3702;
    std::chrono::milliseconds deviceInfoTimeout{5000};
};

// ONVIF WS-Discovery probe and GetDeviceInformation query
class OnvifProbe {
public:
    OnvifProbe(DiscoveryTransportFactory transports, std::shared_ptr<HttpClient> http,
               const ProfileCatalog& catalog, DiscoveryOptions options = {});

    // Zero replies within the timeout yields an empty list
    std::vector<DeviceRecord> discover();
    std::vector<DeviceRecord> discover(std::chrono::milliseconds timeout);

    // nullopt on authentication failure, transport error or unparseable reply
    std::optional<DeviceRecord> getDeviceInfo(const std::string& ip, std::uint16_t port,
                                              const std::string& username,
                                              const std::string& password);

    // nullopt unless the payload is a ProbeMatch
    std::optional<DeviceRecord> parseProbeMatch(const std::string& xml,
                                                const std::string& sourceIp) const;

    static std::string newMessageId();
    static std::string buildProbeMessage(const std::string& messageId);
    static std::string buildDeviceInfoRequest(const std::string& securityHeader);
    static std::optional<DeviceRecord> parseDeviceInformation(const std::string& xml,
                                                              const std::string& ip,
                                                              std::uint16_t port);

    const DiscoveryOptions& options() const { return options_; }

private:
    DiscoveryTransportFactory transports_;
    std::shared_ptr<HttpClient> http_;
    const ProfileCatalog& catalog_;
    DiscoveryOptions options_;
};

DiscoveryTransportFactory udpDiscoveryTransportFactory(const DiscoveryOptions& options);

std::string urlDecode(const std::string& text);

} // namespace cw
