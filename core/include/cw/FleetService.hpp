#pragma once

#include "cw/Config.hpp"
#include "cw/ConnectionTester.hpp"
#include "cw/DeviceStore.hpp"
#include "cw/EventBus.hpp"
#include "cw/HealthMonitor.hpp"
#include "cw/HostProber.hpp"
#include "cw/HttpClient.hpp"
#include "cw/NetworkScanner.hpp"
#include "cw/OnvifProbe.hpp"
#include "cw/ProfileCatalog.hpp"
#include "cw/StreamBroadcaster.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw {

// Collaborators the service is built from; tests substitute fakes
struct FleetComponents {
    std::shared_ptr<ProfileCatalog> catalog;
    std::shared_ptr<HostProber> prober;
    std::shared_ptr<HttpClient> http;
    MediaSourceFactory sources;
    DiscoveryTransportFactory transports;
    std::shared_ptr<DeviceStore> store;
    // Built from catalog, http and sources when left empty
    std::shared_ptr<ConnectionTester> tester;
};

// Real network, FFmpeg and SQLite implementations. store is null when the
// database cannot be opened.
FleetComponents makeDefaultComponents(const Config& config);

struct AutoDetectReport {
    bool success = false;
    std::string ip;
    std::string vendor;                       // hint after discovery refinement
    std::optional<ConnectionTestResult> recommended;
    std::vector<ConnectionTestResult> results;
    std::optional<DeviceRecord> deviceInfo;   // from GetDeviceInformation
};

// Facade wiring scanning, discovery, connection testing, health and streaming
class FleetService {
public:
    FleetService(Config config, FleetComponents components);
    ~FleetService();

    FleetService(const FleetService&) = delete;
    FleetService& operator=(const FleetService&) = delete;

    // Invalid ranges are logged and yield an empty list.
    // No range means the configured network, else the local /24.
    std::vector<DeviceRecord> scanNetwork(const std::optional<std::string>& range = std::nullopt,
                                          ScanProgress progress = nullptr,
                                          const std::atomic<bool>* stop = nullptr);
    std::vector<DeviceRecord> discoverByProtocol();
    // Port sweep plus discovery, merged by address
    std::vector<DeviceRecord> discoverAll(const std::optional<std::string>& range = std::nullopt);

    std::optional<DeviceRecord> getDeviceInfo(const std::string& ip, std::uint16_t port,
                                              const std::string& username,
                                              const std::string& password);

    CandidateUrls generateCandidateUrls(const std::string& ip, const std::string& vendor,
                                        const std::string& username,
                                        const std::string& password) const;

    AutoDetectReport autoDetect(const std::string& ip, const std::string& username,
                                const std::string& password, const std::string& vendorHint = {});

    ConnectionTestResult testConnection(const std::string& url, ConnectionKind kind,
                                        const std::string& username = {},
                                        const std::string& password = {});

    // Autodetects the device and stores it with the recommended URL
    std::optional<DeviceId> addCamera(const std::string& name, const std::string& ip,
                                      const Credentials& credentials,
                                      const std::string& vendorHint = {});
    std::vector<ManagedDevice> listDevices();

    bool startMonitoring();
    void stopMonitoring();
    void runHealthSweep();
    std::optional<CameraHealthStatus> getCameraHealth(DeviceId id) const;
    std::vector<CameraHealthStatus> getAllHealthStatus() const;
    std::optional<SystemHealthSummary> getSystemHealthSummary() const;
    std::optional<ReconnectionStatus> getReconnectionStatus(DeviceId id) const;
    std::optional<CameraHealthStatus> requestRecheck(DeviceId id);

    // Streams the device's stored URL
    bool startStream(DeviceId id);
    void stopStream(DeviceId id);

    const Config& config() const { return config_; }
    const ProfileCatalog& catalog() const { return *catalog_; }
    EventBus& events() { return events_; }
    StreamBroadcaster& streams() { return *streams_; }
    HealthMonitor* health() { return health_.get(); }

private:
    Config config_;
    EventBus events_;
    std::shared_ptr<ProfileCatalog> catalog_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<DeviceStore> store_;
    std::shared_ptr<ConnectionTester> tester_;
    std::unique_ptr<NetworkScanner> scanner_;
    std::unique_ptr<OnvifProbe> probe_;
    std::unique_ptr<HealthMonitor> health_;
    std::unique_ptr<StreamBroadcaster> streams_;
};

} // namespace cw
