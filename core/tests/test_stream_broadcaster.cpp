#include <gtest/gtest.h>
#include "cw/StreamBroadcaster.hpp"
#include "fakes.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <thread>

using namespace cw;
using namespace cw::test;
using namespace std::chrono_literals;

namespace {

// Stand-in for JPEG encoding: the frame's sequence number as text
std::optional<std::string> sequenceEncoder(const Frame& frame, int) {
    return "jpeg#" + std::to_string(frame.sequence);
}

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds limit = 3s) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

class StreamBroadcasterTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.reconnectDelay = 5ms;
        options.openTimeout = 100ms;
        events.subscribe(kStreamStateChannel, [this](const std::string& msg) {
            auto evt = nlohmann::json::parse(msg);
            std::lock_guard<std::mutex> lock(statesMutex);
            eventNames.push_back(evt["event"].get<std::string>());
            states.push_back(evt["state"].get<std::string>());
        });
    }

    std::unique_ptr<StreamBroadcaster> make() {
        auto b = std::make_unique<StreamBroadcaster>(fakeMediaFactory(script), options, &events);
        b->setEncoder(sequenceEncoder);
        return b;
    }

    bool sawState(const std::string& state) {
        std::lock_guard<std::mutex> lock(statesMutex);
        return std::find(states.begin(), states.end(), state) != states.end();
    }

    std::shared_ptr<MediaScript> script = std::make_shared<MediaScript>();
    StreamOptions options;
    EventBus events;
    std::mutex statesMutex;
    std::vector<std::string> states;
    std::vector<std::string> eventNames;
};

TEST_F(StreamBroadcasterTest, StartIsIdempotent) {
    auto b = make();
    EXPECT_TRUE(b->startStream(1, "rtsp://10.0.0.1/live", "Front"));
    EXPECT_TRUE(b->startStream(1, "rtsp://10.0.0.1/live", "Front"));
    ASSERT_TRUE(waitUntil([&] { return b->getFrame(1) != nullptr; }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(script->opens.load(), 1);
    EXPECT_EQ(script->maxLive.load(), 1);
    EXPECT_EQ(b->listStreams().size(), 1u);

    auto info = b->getStreamInfo(1);
    ASSERT_TRUE(info);
    EXPECT_EQ(info->name, "Front");
    EXPECT_TRUE(info->running);
    EXPECT_EQ(info->width, 64);
    EXPECT_EQ(info->height, 48);
    EXPECT_GT(info->framesCaptured, 0u);
    EXPECT_FALSE(info->error.has_value());
    EXPECT_TRUE(sawState("connected"));
}

TEST_F(StreamBroadcasterTest, RejectsEmptyUrl) {
    auto b = make();
    EXPECT_FALSE(b->startStream(2, ""));
    EXPECT_FALSE(b->getStreamInfo(2).has_value());
    EXPECT_TRUE(b->subscribe(2, "viewer") == nullptr);
    EXPECT_FALSE(b->generateLiveSequence(2).has_value());
}

TEST_F(StreamBroadcasterTest, SlowSubscriberDoesNotStallOthers) {
    options.queueSize = 2;
    auto b = make();
    ASSERT_TRUE(b->startStream(3, "rtsp://10.0.0.3/live"));
    auto slow = b->subscribe(3, "slow");
    auto fast = b->subscribe(3, "fast");
    ASSERT_TRUE(slow && fast);
    EXPECT_EQ(b->subscribe(3, "fast"), fast);
    EXPECT_EQ(b->getStreamInfo(3)->subscribers, 2u);

    std::vector<std::uint64_t> received;
    while (received.size() < 10) {
        auto item = fast->pop(2s);
        ASSERT_TRUE(item.has_value());
        received.push_back((*item)->sequence);
    }
    for (std::size_t i = 1; i < received.size(); ++i)
        EXPECT_GT(received[i], received[i - 1]);

    EXPECT_LE(slow->size(), 2u);
    EXPECT_GT(slow->dropped(), 0u);
    // Drop-newest keeps the first frames the slow reader was offered
    auto first = slow->tryPop();
    ASSERT_TRUE(first.has_value());
    EXPECT_LT((*first)->sequence, received.back());
    EXPECT_EQ((*first)->jpeg, "jpeg#" + std::to_string((*first)->sequence));
}

TEST_F(StreamBroadcasterTest, UnsubscribeClosesQueue) {
    auto b = make();
    ASSERT_TRUE(b->startStream(4, "rtsp://10.0.0.4/live"));
    auto q = b->subscribe(4, "viewer");
    ASSERT_TRUE(q);
    b->unsubscribe(4, "viewer");
    EXPECT_TRUE(q->closed());
    EXPECT_EQ(b->getStreamInfo(4)->subscribers, 0u);
}

TEST_F(StreamBroadcasterTest, StopEndsConsumers) {
    auto b = make();
    ASSERT_TRUE(b->startStream(5, "rtsp://10.0.0.5/live"));
    auto q = b->subscribe(5, "viewer");
    auto live = b->generateLiveSequence(5, 50);
    ASSERT_TRUE(q && live);

    auto part = live->next();
    ASSERT_TRUE(part.has_value());
    EXPECT_EQ(part->rfind("--frame\r\nContent-Type: image/jpeg\r\n\r\njpeg#", 0), 0u);
    EXPECT_EQ(part->substr(part->size() - 2), "\r\n");

    b->stopStream(5);
    EXPECT_TRUE(q->closed());
    EXPECT_FALSE(live->next().has_value());
    EXPECT_TRUE(live->finished());
    EXPECT_FALSE(b->getStreamInfo(5).has_value());
    EXPECT_EQ(script->live.load(), 0);
    EXPECT_TRUE(sawState("stopped"));
}

TEST_F(StreamBroadcasterTest, LiveSequenceHonoursFpsLimit) {
    script->frameInterval = 1ms;
    auto b = make();
    ASSERT_TRUE(b->startStream(6, "rtsp://10.0.0.6/live"));
    auto live = b->generateLiveSequence(6, 10);
    ASSERT_TRUE(live);
    ASSERT_TRUE(live->next().has_value());
    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(live->next().has_value());
    ASSERT_TRUE(live->next().has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 180ms);
}

TEST_F(StreamBroadcasterTest, GivesUpAfterMaxReconnects) {
    options.maxReconnectAttempts = 3;
    script->openable = {"rtsp://10.0.0.99/other"};
    auto b = make();
    ASSERT_TRUE(b->startStream(7, "rtsp://10.0.0.7/live"));
    ASSERT_TRUE(waitUntil([&] { return sawState("failed"); }));

    auto info = b->getStreamInfo(7);
    ASSERT_TRUE(info);
    EXPECT_FALSE(info->running);
    EXPECT_EQ(info->reconnectAttempts, 3);
    EXPECT_EQ(info->error.value_or(""), "Max reconnection attempts reached");
    EXPECT_TRUE(sawState("reconnecting"));

    // A finished stream hands out closed queues and can be started again
    ASSERT_TRUE(waitUntil([&] {
        auto q = b->subscribe(7, "late");
        return q && q->closed();
    }));
    script->openable.clear();
    EXPECT_TRUE(b->startStream(7, "rtsp://10.0.0.7/live"));
    ASSERT_TRUE(waitUntil([&] { return b->getFrame(7) != nullptr; }));
    EXPECT_EQ(b->getStreamInfo(7)->reconnectAttempts, 0);
}

TEST_F(StreamBroadcasterTest, ReconnectsAfterStreamEnds) {
    script->framesPerOpen = 3;
    auto b = make();
    ASSERT_TRUE(b->startStream(8, "rtsp://10.0.0.8/live"));
    ASSERT_TRUE(waitUntil([&] { return script->opens.load() >= 3; }));
    EXPECT_EQ(script->maxLive.load(), 1);
    auto info = b->getStreamInfo(8);
    ASSERT_TRUE(info);
    EXPECT_GE(info->framesCaptured, 6u);
    EXPECT_TRUE(sawState("reconnecting"));
}

TEST_F(StreamBroadcasterTest, SnapshotUsesLatestFrame) {
    auto b = make();
    EXPECT_FALSE(b->getSnapshotImage(9).has_value());
    ASSERT_TRUE(b->startStream(9, "rtsp://10.0.0.9/live"));
    ASSERT_TRUE(waitUntil([&] { return b->getFrame(9) != nullptr; }));
    auto image = b->getSnapshotImage(9);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->rfind("jpeg#", 0), 0u);
}

TEST_F(StreamBroadcasterTest, StateEventsNameTheirChannel) {
    auto b = make();
    ASSERT_TRUE(b->startStream(4, "rtsp://10.0.0.4/live", "Yard"));
    ASSERT_TRUE(waitUntil([&] { return sawState("connected"); }));
    b->stopStream(4);
    std::lock_guard<std::mutex> lock(statesMutex);
    ASSERT_FALSE(eventNames.empty());
    for (const auto& name : eventNames)
        EXPECT_EQ(name, kStreamStateChannel);
}

TEST_F(StreamBroadcasterTest, StopInterruptsBlockedOpen) {
    script->hangOnOpen = true;
    options.openTimeout = 10s;
    auto b = make();
    ASSERT_TRUE(b->startStream(5, "rtsp://10.0.0.5/live", "Attic"));
    ASSERT_TRUE(waitUntil([&] { return script->hanging.load() == 1; }));

    auto start = std::chrono::steady_clock::now();
    b->stopStream(5);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(script->hanging.load(), 0);
    EXPECT_TRUE(b->listStreams().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
