#include "cw/FleetService.hpp"
#include "cw/Log.hpp"

#include <stdexcept>

namespace cw {

FleetComponents makeDefaultComponents(const Config& config) {
    FleetComponents c;
    c.catalog = std::make_shared<ProfileCatalog>();
    if (config.profilesFile && !c.catalog->loadProfilesFile(*config.profilesFile))
        log(LogLevel::Warn, "Vendor profiles file %s not loaded, using built-in table",
            config.profilesFile->c_str());
    c.prober = std::make_shared<PosixHostProber>();
    c.http = std::make_shared<AvioHttpClient>();
    c.sources = ffmpegMediaSourceFactory();
    c.transports = udpDiscoveryTransportFactory(config.discovery);

    auto store = std::make_shared<SqliteDeviceStore>(config.database);
    if (store->open())
        c.store = store;
    else
        log(LogLevel::Error, "Device database %s unavailable; health monitoring disabled",
            config.database.c_str());
    return c;
}

FleetService::FleetService(Config config, FleetComponents components)
    : config_(std::move(config)),
      catalog_(components.catalog ? components.catalog : std::make_shared<ProfileCatalog>()),
      http_(components.http),
      store_(components.store),
      tester_(components.tester) {
    if (!tester_)
        tester_ = std::make_shared<ConnectionTester>(*catalog_, http_, components.sources,
                                                     config_.connection);
    if (components.prober)
        scanner_ = std::make_unique<NetworkScanner>(components.prober, *catalog_, config_.scanner);
    if (components.transports)
        probe_ = std::make_unique<OnvifProbe>(components.transports, http_, *catalog_,
                                              config_.discovery);
    if (store_)
        health_ = std::make_unique<HealthMonitor>(store_, tester_, config_.health, &events_);
    streams_ = std::make_unique<StreamBroadcaster>(components.sources, config_.streaming, &events_);
}

FleetService::~FleetService() {
    stopMonitoring();
    streams_->stopAll();
}

std::vector<DeviceRecord> FleetService::scanNetwork(const std::optional<std::string>& range,
                                                    ScanProgress progress,
                                                    const std::atomic<bool>* stop) {
    if (!scanner_) {
        log(LogLevel::Error, "Network scan requested without a host prober");
        return {};
    }
    std::optional<std::string> target = range;
    if (!target)
        target = config_.network;
    if (!target)
        target = NetworkScanner::localNetwork();
    if (!target) {
        log(LogLevel::Error, "No scan range given and the local network could not be determined");
        return {};
    }

    try {
        return scanner_->scan(*target, std::move(progress), stop);
    } catch (const std::invalid_argument& e) {
        log(LogLevel::Error, "Invalid scan range \"%s\": %s", target->c_str(), e.what());
        return {};
    }
}

std::vector<DeviceRecord> FleetService::discoverByProtocol() {
    if (!probe_) {
        log(LogLevel::Error, "Discovery requested without a transport");
        return {};
    }
    return probe_->discover();
}

std::vector<DeviceRecord> FleetService::discoverAll(const std::optional<std::string>& range) {
    auto records = scanNetwork(range);
    auto discovered = discoverByProtocol();
    log(LogLevel::Info, "Merging %zu scanned and %zu discovered devices", records.size(),
        discovered.size());
    records.insert(records.end(), std::make_move_iterator(discovered.begin()),
                   std::make_move_iterator(discovered.end()));
    return mergeDeviceRecords(std::move(records));
}

std::optional<DeviceRecord> FleetService::getDeviceInfo(const std::string& ip, std::uint16_t port,
                                                        const std::string& username,
                                                        const std::string& password) {
    if (!probe_)
        return std::nullopt;
    return probe_->getDeviceInfo(ip, port, username, password);
}

CandidateUrls FleetService::generateCandidateUrls(const std::string& ip, const std::string& vendor,
                                                  const std::string& username,
                                                  const std::string& password) const {
    return catalog_->expandUrls(vendor, ip, username, password, config_.connection.channel,
                                config_.connection.stream);
}

AutoDetectReport FleetService::autoDetect(const std::string& ip, const std::string& username,
                                          const std::string& password,
                                          const std::string& vendorHint) {
    AutoDetectReport report;
    report.ip = ip;
    report.vendor = vendorHint;

    auto order = catalog_->priorityOrder(vendorHint);
    if (!order.empty() && order.front() == ProbeMethod::Onvif && !username.empty() && probe_) {
        const auto& profile = catalog_->getProfile(vendorHint);
        report.deviceInfo = probe_->getDeviceInfo(ip, profile.onvifPort, username, password);
        if (report.deviceInfo && report.deviceInfo->vendor && !report.deviceInfo->vendor->empty()) {
            if (*report.deviceInfo->vendor != report.vendor)
                log(LogLevel::Info, "%s identifies as %s", ip.c_str(),
                    report.deviceInfo->vendor->c_str());
            report.vendor = *report.deviceInfo->vendor;
        }
    }

    auto outcome = tester_->autoDetectBestConnection(ip, username, password, report.vendor);
    report.success = outcome.best.has_value();
    report.recommended = std::move(outcome.best);
    report.results = std::move(outcome.all);
    return report;
}

ConnectionTestResult FleetService::testConnection(const std::string& url, ConnectionKind kind,
                                                  const std::string& username,
                                                  const std::string& password) {
    switch (kind) {
    case ConnectionKind::Stream:
        return tester_->testStreamingUrl(withCredentials(url, Credentials{username, password}));
    case ConnectionKind::HttpImage:
        return tester_->testHttpImageUrl(url, username, password);
    case ConnectionKind::Snapshot:
        return tester_->testSnapshotUrl(url, username, password);
    }
    return {};
}

std::optional<DeviceId> FleetService::addCamera(const std::string& name, const std::string& ip,
                                                const Credentials& credentials,
                                                const std::string& vendorHint) {
    if (!store_) {
        log(LogLevel::Error, "Cannot add %s: no device database", ip.c_str());
        return std::nullopt;
    }
    auto report = autoDetect(ip, credentials.username, credentials.password, vendorHint);
    if (!report.recommended) {
        log(LogLevel::Warn, "No working connection found for %s", ip.c_str());
        return std::nullopt;
    }
    if (report.recommended->kind == ConnectionKind::Snapshot) {
        log(LogLevel::Warn, "%s only answers snapshots at %s; not added", ip.c_str(),
            report.recommended->url.c_str());
        return std::nullopt;
    }

    ManagedDevice device;
    device.name = name;
    device.ip = ip;
    device.url = report.recommended->url;
    device.kind = report.recommended->kind;
    device.credentials = credentials;
    device.vendorHint = report.vendor;
    device.health = healthTierFor(true, report.recommended->responseTimeMs);
    device.online = true;
    device.lastSeen = std::chrono::system_clock::now();

    auto id = store_->addDevice(device);
    if (id)
        log(LogLevel::Info, "Added camera %lld (%s) at %s via %s", static_cast<long long>(*id),
            name.c_str(), ip.c_str(), toString(device.kind));
    return id;
}

std::vector<ManagedDevice> FleetService::listDevices() {
    if (!store_)
        return {};
    return store_->listDevices();
}

bool FleetService::startMonitoring() {
    if (!health_) {
        log(LogLevel::Error, "Health monitoring needs a device database");
        return false;
    }
    return health_->start();
}

void FleetService::stopMonitoring() {
    if (health_)
        health_->stop();
}

void FleetService::runHealthSweep() {
    if (health_)
        health_->sweepOnce();
}

std::optional<CameraHealthStatus> FleetService::getCameraHealth(DeviceId id) const {
    if (!health_)
        return std::nullopt;
    return health_->getCameraHealth(id);
}

std::vector<CameraHealthStatus> FleetService::getAllHealthStatus() const {
    if (!health_)
        return {};
    return health_->getAllHealthStatus();
}

std::optional<SystemHealthSummary> FleetService::getSystemHealthSummary() const {
    if (!health_)
        return std::nullopt;
    return health_->getSystemHealthSummary();
}

std::optional<ReconnectionStatus> FleetService::getReconnectionStatus(DeviceId id) const {
    if (!health_)
        return std::nullopt;
    return health_->getReconnectionStatus(id);
}

std::optional<CameraHealthStatus> FleetService::requestRecheck(DeviceId id) {
    if (!health_)
        return std::nullopt;
    return health_->requestRecheck(id);
}

bool FleetService::startStream(DeviceId id) {
    if (!store_)
        return false;
    auto device = store_->getDevice(id);
    if (!device) {
        log(LogLevel::Warn, "Cannot stream unknown device %lld", static_cast<long long>(id));
        return false;
    }
    if (device->kind != ConnectionKind::Stream) {
        log(LogLevel::Warn, "Device %lld is reached by %s, not a stream", static_cast<long long>(id),
            toString(device->kind));
        return false;
    }
    return streams_->startStream(id, withCredentials(device->url, device->credentials), device->name);
}

void FleetService::stopStream(DeviceId id) {
    streams_->stopStream(id);
}

} // namespace cw
