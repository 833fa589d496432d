#include <gtest/gtest.h>
#include "cw/EventBus.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace cw;

TEST(EventBusTest, BasicSubscribePublish) {
    EventBus bus;
    std::vector<std::string> rec1;
    std::vector<std::string> rec2;

    bus.subscribe("foo", [&rec1](const std::string& msg) { rec1.push_back(msg); });
    bus.subscribe("foo", [&rec2](const std::string& msg) { rec2.push_back(msg); });

    bus.publish("foo", "hello");
    bus.publish("other", "world"); // no subscribers here
    bus.publish("foo", "world");

    ASSERT_EQ(rec1.size(), 2u);
    ASSERT_EQ(rec2.size(), 2u);
    EXPECT_EQ(rec1[0], "hello");
    EXPECT_EQ(rec1[1], "world");
    EXPECT_EQ(rec2[0], "hello");
    EXPECT_EQ(rec2[1], "world");
}

TEST(EventBusTest, NoSubscribers) {
    EventBus bus;
    bus.publish("nobody", "nothing");
    EXPECT_EQ(bus.subscriberCount("nobody"), 0u);
}

TEST(EventBusTest, UnsubscribeByToken) {
    EventBus bus;
    int a = 0;
    int b = 0;
    auto ta = bus.subscribe(kCameraStatusChannel, [&a](const std::string&) { ++a; });
    bus.subscribe(kCameraStatusChannel, [&b](const std::string&) { ++b; });
    EXPECT_EQ(bus.subscriberCount(kCameraStatusChannel), 2u);

    bus.unsubscribe(ta);
    bus.publish(kCameraStatusChannel, "{}");
    EXPECT_EQ(a, 0);
    EXPECT_EQ(b, 1);
    EXPECT_EQ(bus.subscriberCount(kCameraStatusChannel), 1u);
}

TEST(EventBusTest, ThrowingSubscriberDoesNotStopOthers) {
    EventBus bus;
    int delivered = 0;
    bus.subscribe("ch", [](const std::string&) { throw std::runtime_error("bad handler"); });
    bus.subscribe("ch", [&delivered](const std::string&) { ++delivered; });
    bus.publish("ch", "x");
    EXPECT_EQ(delivered, 1);
}

TEST(EventBusTest, InstancesAreIndependent) {
    EventBus first;
    EventBus second;
    int hits = 0;
    first.subscribe("ch", [&hits](const std::string&) { ++hits; });
    second.publish("ch", "x");
    EXPECT_EQ(hits, 0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
