#include <gtest/gtest.h>
#include "cw/NetworkScanner.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <stdexcept>

using namespace cw;
using cw::test::FakeHostProber;

namespace {

ScanOptions fastOptions() {
    ScanOptions opts;
    opts.timeout = std::chrono::milliseconds(10);
    opts.concurrency = 8;
    return opts;
}

} // namespace

TEST(NetworkScannerTest, FindsHostsAndClassifies) {
    auto prober = std::make_shared<FakeHostProber>();
    prober->open["192.168.1.10"] = {554, 80};
    prober->open["192.168.1.3"] = {8080, 37777};
    prober->open["192.168.1.20"] = {443}; // no quick port answers
    prober->names["192.168.1.10"] = "cam-lobby.local";
    prober->macs["192.168.1.10"] = "00:1D:7E:01:02:03";

    ProfileCatalog catalog;
    NetworkScanner scanner(prober, catalog, fastOptions());
    auto devices = scanner.scan("192.168.1.0/27");

    ASSERT_EQ(devices.size(), 2u);
    // Ordered by numeric address, not text
    EXPECT_EQ(devices[0].ip, "192.168.1.3");
    EXPECT_EQ(devices[0].type, DeviceType::Nvr);
    EXPECT_EQ(devices[0].openPorts, (std::set<std::uint16_t>{8080, 37777}));

    EXPECT_EQ(devices[1].ip, "192.168.1.10");
    EXPECT_EQ(devices[1].type, DeviceType::Camera);
    EXPECT_EQ(devices[1].openPorts, (std::set<std::uint16_t>{80, 554}));
    EXPECT_EQ(devices[1].hostname.value_or(""), "cam-lobby.local");
    EXPECT_EQ(devices[1].vendor.value_or(""), "hikvision");
    EXPECT_FALSE(devices[1].viaDiscovery);
}

TEST(NetworkScannerTest, HostWithoutQuickPortsIsSkipped) {
    auto prober = std::make_shared<FakeHostProber>();
    prober->open["10.0.0.1"] = {8000, 443};
    ProfileCatalog catalog;
    NetworkScanner scanner(prober, catalog, fastOptions());
    EXPECT_FALSE(scanner.scanHost("10.0.0.1").has_value());
    // Only the three quick ports were tried
    EXPECT_EQ(prober->probes.load(), 3);
}

TEST(NetworkScannerTest, ResolutionCanBeDisabled) {
    auto prober = std::make_shared<FakeHostProber>();
    prober->open["10.0.0.2"] = {554};
    prober->names["10.0.0.2"] = "cam";
    prober->macs["10.0.0.2"] = "00:40:8C:00:00:01";
    ScanOptions opts = fastOptions();
    opts.resolveNames = false;
    opts.resolveHardware = false;
    ProfileCatalog catalog;
    NetworkScanner scanner(prober, catalog, opts);
    auto record = scanner.scanHost("10.0.0.2");
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->hostname.has_value());
    EXPECT_FALSE(record->mac.has_value());
    EXPECT_FALSE(record->vendor.has_value());
}

TEST(NetworkScannerTest, ReportsProgressForEveryHost) {
    auto prober = std::make_shared<FakeHostProber>();
    ProfileCatalog catalog;
    NetworkScanner scanner(prober, catalog, fastOptions());
    std::size_t calls = 0;
    std::size_t lastTotal = 0;
    std::size_t maxScanned = 0;
    scanner.scan("10.0.0.1-10.0.0.20", [&](std::size_t scanned, std::size_t total, const std::string&) {
        ++calls;
        lastTotal = total;
        maxScanned = std::max(maxScanned, scanned);
    });
    EXPECT_EQ(calls, 20u);
    EXPECT_EQ(lastTotal, 20u);
    EXPECT_EQ(maxScanned, 20u);
}

TEST(NetworkScannerTest, StopFlagAbortsScan) {
    auto prober = std::make_shared<FakeHostProber>();
    prober->open["10.0.0.5"] = {554};
    ProfileCatalog catalog;
    NetworkScanner scanner(prober, catalog, fastOptions());
    std::atomic<bool> stop{true};
    auto devices = scanner.scan("10.0.0.0/24", nullptr, &stop);
    EXPECT_TRUE(devices.empty());
    EXPECT_EQ(prober->probes.load(), 0);
}

TEST(NetworkScannerTest, InvalidRangeThrows) {
    auto prober = std::make_shared<FakeHostProber>();
    ProfileCatalog catalog;
    NetworkScanner scanner(prober, catalog, fastOptions());
    EXPECT_THROW(scanner.scan("10.0.0.0/8"), std::invalid_argument);
    EXPECT_THROW(scanner.scan("garbage"), std::invalid_argument);
}

TEST(NetworkScannerTest, Classify) {
    EXPECT_EQ(NetworkScanner::classify({8554}), DeviceType::Camera);
    EXPECT_EQ(NetworkScanner::classify({554, 37777}), DeviceType::Camera);
    EXPECT_EQ(NetworkScanner::classify({8000}), DeviceType::Nvr);
    EXPECT_EQ(NetworkScanner::classify({80, 443}), DeviceType::Unknown);
}

TEST(NetworkScannerTest, MergeCombinesEvidence) {
    DeviceRecord scanned;
    scanned.ip = "10.0.0.9";
    scanned.openPorts = {554};
    scanned.mac = std::string("00:40:8c:00:00:01");

    DeviceRecord discovered;
    discovered.ip = "10.0.0.9";
    discovered.openPorts = {80};
    discovered.viaDiscovery = true;
    discovered.model = std::string("P3245");
    discovered.mac = std::string("ignored");

    DeviceRecord other;
    other.ip = "10.0.0.10";

    auto merged = mergeDeviceRecords({other, scanned, discovered});
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].ip, "10.0.0.9");
    EXPECT_EQ(merged[0].openPorts, (std::set<std::uint16_t>{80, 554}));
    EXPECT_TRUE(merged[0].viaDiscovery);
    EXPECT_EQ(merged[0].model.value_or(""), "P3245");
    EXPECT_EQ(merged[0].mac.value_or(""), "00:40:8c:00:00:01");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
