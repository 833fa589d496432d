#include <gtest/gtest.h>
#include "cw/DeviceStore.hpp"

using namespace cw;

namespace {

ManagedDevice makeDevice(const std::string& name, const std::string& ip) {
    ManagedDevice d;
    d.name = name;
    d.ip = ip;
    d.url = "rtsp://" + ip + ":554/stream1";
    d.kind = ConnectionKind::Stream;
    d.credentials = Credentials{"admin", "secret"};
    d.vendorHint = "hikvision";
    return d;
}

} // namespace

class DeviceStoreTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(store.open()); }
    SqliteDeviceStore store{":memory:"};
};

TEST_F(DeviceStoreTest, AddAndGet) {
    auto id = store.addDevice(makeDevice("Front", "192.168.1.20"));
    ASSERT_TRUE(id.has_value());
    auto d = store.getDevice(*id);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->name, "Front");
    EXPECT_EQ(d->ip, "192.168.1.20");
    EXPECT_EQ(d->url, "rtsp://192.168.1.20:554/stream1");
    EXPECT_EQ(d->kind, ConnectionKind::Stream);
    EXPECT_EQ(d->credentials.password, "secret");
    EXPECT_EQ(d->vendorHint, "hikvision");
    EXPECT_TRUE(d->active);
    EXPECT_FALSE(d->online);
    EXPECT_EQ(d->health, HealthTier::Unknown);
    EXPECT_FALSE(d->lastSeen.has_value());
    EXPECT_FALSE(store.getDevice(*id + 100).has_value());
}

TEST_F(DeviceStoreTest, ActiveFilter) {
    auto a = store.addDevice(makeDevice("A", "10.0.0.1"));
    auto b = store.addDevice(makeDevice("B", "10.0.0.2"));
    ASSERT_TRUE(a && b);
    EXPECT_TRUE(store.setActive(*b, false));
    EXPECT_EQ(store.listDevices().size(), 2u);
    auto active = store.listActiveDevices();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].id, *a);
}

TEST_F(DeviceStoreTest, UpdateConnectionAndStatus) {
    auto id = store.addDevice(makeDevice("Yard", "10.0.0.3"));
    ASSERT_TRUE(id);
    EXPECT_TRUE(store.updateDeviceConnection(*id, "http://10.0.0.3/video.mjpg", ConnectionKind::HttpImage));

    DeviceStatusUpdate up;
    up.online = true;
    up.lastSeen = std::chrono::system_clock::from_time_t(1700000000);
    up.health = HealthTier::Good;
    store.updateDeviceStatus(*id, up);

    DeviceStatusUpdate down;
    down.online = false;
    down.health = HealthTier::Offline;
    down.failureCount = 2;
    down.lastError = "Connection refused";
    EXPECT_TRUE(store.updateDeviceStatus(*id, down));

    auto d = store.getDevice(*id);
    ASSERT_TRUE(d);
    EXPECT_EQ(d->url, "http://10.0.0.3/video.mjpg");
    EXPECT_EQ(d->kind, ConnectionKind::HttpImage);
    EXPECT_FALSE(d->online);
    EXPECT_EQ(d->health, HealthTier::Offline);
    EXPECT_EQ(d->failureCount, 2);
    EXPECT_EQ(d->lastError.value_or(""), "Connection refused");
    // An offline update keeps the last time the device was seen
    ASSERT_TRUE(d->lastSeen.has_value());
    EXPECT_EQ(std::chrono::system_clock::to_time_t(*d->lastSeen), 1700000000);
}

TEST_F(DeviceStoreTest, UnknownDeviceUpdatesFail) {
    EXPECT_FALSE(store.updateDeviceConnection(99, "rtsp://x", ConnectionKind::Stream));
    EXPECT_FALSE(store.updateDeviceStatus(99, DeviceStatusUpdate{}));
    EXPECT_FALSE(store.removeDevice(99));
}

TEST_F(DeviceStoreTest, Remove) {
    auto id = store.addDevice(makeDevice("Gone", "10.0.0.4"));
    ASSERT_TRUE(id);
    EXPECT_TRUE(store.removeDevice(*id));
    EXPECT_TRUE(store.listDevices().empty());
}

TEST(DeviceStoreClosedTest, OperationsFailBeforeOpen) {
    SqliteDeviceStore store(":memory:");
    EXPECT_FALSE(store.isOpen());
    EXPECT_FALSE(store.addDevice(ManagedDevice{}).has_value());
    EXPECT_TRUE(store.listActiveDevices().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
