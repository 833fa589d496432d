#include <gtest/gtest.h>
#include "cw/FleetService.hpp"
#include "cw/Json.hpp"
#include "fakes.hpp"

#include <thread>

using namespace cw;
using namespace cw::test;
using namespace std::chrono_literals;

namespace {

const char* kProbeMatch = R"(<d:ProbeMatches><d:ProbeMatch>
<d:Scopes>onvif://www.onvif.org/name/Lobby onvif://www.onvif.org/hardware/DS-2CD2142</d:Scopes>
<d:XAddrs>http://10.0.0.3:8080/onvif/device_service</d:XAddrs>
</d:ProbeMatch></d:ProbeMatches>)";

const char* kAxisInfo = R"(<env:Envelope><env:Body><tds:GetDeviceInformationResponse>
<tds:Manufacturer>AXIS</tds:Manufacturer><tds:Model>M3106</tds:Model>
<tds:FirmwareVersion>9.80</tds:FirmwareVersion><tds:HardwareId>71A</tds:HardwareId>
</tds:GetDeviceInformationResponse></env:Body></env:Envelope>)";

ConnectionTestResult working(ConnectionKind kind, const std::string& url, double latency) {
    ConnectionTestResult r;
    r.success = true;
    r.kind = kind;
    r.url = url;
    r.responseTimeMs = latency;
    return r;
}

} // namespace

class FleetServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.discovery.timeout = 100ms;
        config.scanner.resolveNames = false;
        config.scanner.resolveHardware = false;
        ASSERT_TRUE(store->open());
        components.catalog = catalog;
        components.prober = prober;
        components.http = http;
        components.sources = fakeMediaFactory(media);
        components.store = store;
        components.tester = tester;
        components.transports = [this]() -> std::unique_ptr<DiscoveryTransport> {
            return std::make_unique<FakeDiscoveryTransport>(datagrams);
        };
    }

    std::shared_ptr<ProfileCatalog> catalog = std::make_shared<ProfileCatalog>();
    std::shared_ptr<FakeHostProber> prober = std::make_shared<FakeHostProber>();
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<MediaScript> media = std::make_shared<MediaScript>();
    std::shared_ptr<SqliteDeviceStore> store = std::make_shared<SqliteDeviceStore>(":memory:");
    std::shared_ptr<ScriptedConnectionTester> tester = std::make_shared<ScriptedConnectionTester>(*catalog);
    std::deque<Datagram> datagrams;
    Config config;
    FleetComponents components;
};

TEST_F(FleetServiceTest, InvalidRangeYieldsEmptyList) {
    FleetService fleet(config, components);
    EXPECT_TRUE(fleet.scanNetwork(std::string("10.0.0.0/33")).empty());
    EXPECT_TRUE(fleet.scanNetwork(std::string("not-an-address")).empty());
    EXPECT_EQ(prober->probes.load(), 0);
}

TEST_F(FleetServiceTest, ScanFallsBackToConfiguredNetwork) {
    config.network = "10.0.6.7";
    prober->open["10.0.6.7"] = {554};
    FleetService fleet(config, components);
    auto devices = fleet.scanNetwork();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].ip, "10.0.6.7");
    EXPECT_EQ(devices[0].openPorts.count(554), 1u);
}

TEST_F(FleetServiceTest, DiscoverAllMergesSources) {
    prober->open["10.0.0.3"] = {554};
    prober->open["10.0.0.2"] = {80};
    datagrams.push_back({kProbeMatch, "10.0.0.3"});
    FleetService fleet(config, components);

    auto devices = fleet.discoverAll(std::string("10.0.0.1-10.0.0.4"));
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].ip, "10.0.0.2");
    EXPECT_FALSE(devices[0].viaDiscovery);

    const auto& merged = devices[1];
    EXPECT_EQ(merged.ip, "10.0.0.3");
    EXPECT_TRUE(merged.viaDiscovery);
    EXPECT_EQ(merged.name.value_or(""), "Lobby");
    EXPECT_EQ(merged.openPorts, (std::set<std::uint16_t>{554, 8080}));
}

TEST_F(FleetServiceTest, AutoDetectRefinesVendorFromDeviceInformation) {
    const auto port = catalog->getProfile("hikvision").onvifPort;
    http->responses["http://10.0.0.8:" + std::to_string(port) + "/onvif/device_service"] =
        FakeHttpClient::reply(200, "application/soap+xml", kAxisInfo);
    tester->detect = [](const std::string& ip) {
        AutoDetectOutcome out;
        out.best = working(ConnectionKind::Stream, "rtsp://" + ip + ":554/axis-media/media.amp", 250);
        out.all.push_back(*out.best);
        return out;
    };
    FleetService fleet(config, components);

    auto report = fleet.autoDetect("10.0.0.8", "root", "pass", "hikvision");
    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.vendor, "axis");
    EXPECT_EQ(tester->lastVendor, "axis");
    ASSERT_TRUE(report.deviceInfo.has_value());
    EXPECT_EQ(report.deviceInfo->model.value_or(""), "M3106");
    ASSERT_TRUE(report.recommended.has_value());
    EXPECT_EQ(report.results.size(), 1u);

    auto j = nlohmann::json(report);
    EXPECT_EQ(j["vendor"], "axis");
    EXPECT_EQ(j["recommended"]["kind"], toString(ConnectionKind::Stream));
}

TEST_F(FleetServiceTest, AutoDetectSkipsDeviceInformationWithoutCredentials) {
    FleetService fleet(config, components);
    auto report = fleet.autoDetect("10.0.0.8", "", "", "hikvision");
    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.vendor, "hikvision");
    EXPECT_FALSE(report.deviceInfo.has_value());
    EXPECT_TRUE(http->requests.empty());
    EXPECT_EQ(tester->detectCalls.load(), 1);
}

TEST_F(FleetServiceTest, StreamFirstVendorSkipsDeviceInformation) {
    FleetService fleet(config, components);
    fleet.autoDetect("10.0.0.8", "admin", "pw", "generic");
    EXPECT_TRUE(http->requests.empty());
}

TEST_F(FleetServiceTest, AddCameraStoresRecommendedConnection) {
    tester->detect = [](const std::string& ip) {
        AutoDetectOutcome out;
        out.best = working(ConnectionKind::HttpImage, "http://" + ip + "/video.mjpg", 900);
        return out;
    };
    FleetService fleet(config, components);
    auto id = fleet.addCamera("Dock", "10.0.0.12", Credentials{"admin", "pw"}, "generic");
    ASSERT_TRUE(id.has_value());

    auto devices = fleet.listDevices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, *id);
    EXPECT_EQ(devices[0].url, "http://10.0.0.12/video.mjpg");
    EXPECT_EQ(devices[0].kind, ConnectionKind::HttpImage);
    EXPECT_EQ(devices[0].vendorHint, "generic");

    auto j = nlohmann::json(devices[0]);
    EXPECT_FALSE(j.contains("password"));
    EXPECT_EQ(j["username"], "admin");
}

TEST_F(FleetServiceTest, AddCameraFailsWhenNothingWorks) {
    FleetService fleet(config, components);
    EXPECT_FALSE(fleet.addCamera("Void", "10.0.0.13", Credentials{}, "").has_value());
    EXPECT_TRUE(fleet.listDevices().empty());
}

TEST_F(FleetServiceTest, AddCameraRejectsSnapshotOnlyDevice) {
    tester->detect = [](const std::string& ip) {
        AutoDetectOutcome out;
        out.best = working(ConnectionKind::Snapshot, "http://" + ip + "/snap.jpg", 300);
        return out;
    };
    FleetService fleet(config, components);
    EXPECT_FALSE(fleet.addCamera("Shed", "10.0.0.14", Credentials{"admin", "pw"}, "generic").has_value());
    EXPECT_TRUE(fleet.listDevices().empty());
    EXPECT_EQ(tester->detectCalls.load(), 1);
}

TEST_F(FleetServiceTest, CandidateUrlsFollowConfiguredChannel) {
    config.connection.channel = 2;
    FleetService fleet(config, components);
    auto urls = fleet.generateCandidateUrls("10.0.0.5", "hikvision", "admin", "pw");
    auto expected = catalog->expandUrls("hikvision", "10.0.0.5", "admin", "pw", 2, 1);
    EXPECT_EQ(urls.streaming, expected.streaming);
    EXPECT_EQ(urls.snapshot, expected.snapshot);
    ASSERT_FALSE(urls.streaming.empty());
    EXPECT_NE(urls.streaming[0].find("/Streaming/Channels/201"), std::string::npos);
}

TEST_F(FleetServiceTest, StartStreamUsesStoredCredentials) {
    ManagedDevice d;
    d.name = "Hall";
    d.ip = "10.0.0.20";
    d.url = "rtsp://10.0.0.20:554/live";
    d.credentials = Credentials{"admin", "pw"};
    auto id = store->addDevice(d);
    d.url = "http://10.0.0.21/snap.jpg";
    d.kind = ConnectionKind::Snapshot;
    auto snapId = store->addDevice(d);
    ASSERT_TRUE(id && snapId);

    FleetService fleet(config, components);
    EXPECT_FALSE(fleet.startStream(*snapId));
    EXPECT_FALSE(fleet.startStream(*id + 100));
    ASSERT_TRUE(fleet.startStream(*id));
    for (int i = 0; i < 300 && !fleet.streams().getFrame(*id); ++i)
        std::this_thread::sleep_for(10ms);
    ASSERT_TRUE(fleet.streams().getFrame(*id) != nullptr);
    {
        std::lock_guard<std::mutex> lock(media->mutex);
        ASSERT_FALSE(media->openedUrls.empty());
        EXPECT_EQ(media->openedUrls[0], "rtsp://admin:pw@10.0.0.20:554/live");
    }
    fleet.stopStream(*id);
    EXPECT_FALSE(fleet.streams().getStreamInfo(*id).has_value());
}

TEST_F(FleetServiceTest, HealthPassThroughs) {
    ManagedDevice d;
    d.name = "Roof";
    d.ip = "10.0.0.30";
    d.url = "rtsp://10.0.0.30/live";
    auto id = store->addDevice(d);
    ASSERT_TRUE(id);
    tester->healthResults = {ScriptedConnectionTester::online(400)};

    FleetService fleet(config, components);
    std::vector<std::string> events;
    fleet.events().subscribe(kCameraStatusChannel, [&events](const std::string& msg) { events.push_back(msg); });
    fleet.runHealthSweep();

    auto health = fleet.getCameraHealth(*id);
    ASSERT_TRUE(health);
    EXPECT_TRUE(health->online);
    EXPECT_EQ(health->tier, HealthTier::Excellent);
    EXPECT_EQ(fleet.getAllHealthStatus().size(), 1u);
    auto summary = fleet.getSystemHealthSummary();
    ASSERT_TRUE(summary);
    EXPECT_EQ(summary->online, 1u);
    EXPECT_EQ(events.size(), 1u);
    auto reconnection = fleet.getReconnectionStatus(*id);
    ASSERT_TRUE(reconnection);
    EXPECT_EQ(reconnection->attempts, 0);

    tester->healthResults = {ScriptedConnectionTester::offline()};
    auto rechecked = fleet.requestRecheck(*id);
    ASSERT_TRUE(rechecked);
    EXPECT_FALSE(rechecked->online);
}

TEST_F(FleetServiceTest, NoStoreDisablesMonitoring) {
    components.store = nullptr;
    FleetService fleet(config, components);
    EXPECT_FALSE(fleet.startMonitoring());
    EXPECT_FALSE(fleet.getSystemHealthSummary().has_value());
    EXPECT_FALSE(fleet.addCamera("X", "10.0.0.40", Credentials{}, "").has_value());
    EXPECT_TRUE(fleet.listDevices().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
