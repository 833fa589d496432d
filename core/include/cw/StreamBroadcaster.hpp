#pragma once

#include "cw/BoundedQueue.hpp"
#include "cw/EventBus.hpp"
#include "cw/Log.hpp"
#include "cw/MediaSource.hpp"
#include "cw/Types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cw {

struct StreamOptions {
    int maxReconnectAttempts = 5;
    std::chrono::milliseconds reconnectDelay{5000};
    std::chrono::milliseconds openTimeout{5000};
    std::size_t queueSize = 10;
    OverflowPolicy overflow = OverflowPolicy::DropNewest;
    int jpegQuality = 70;
};

// JPEG copy of one captured frame, shared by every subscriber queue
struct EncodedFrame {
    std::string jpeg;
    std::uint64_t sequence = 0;
    int width = 0;
    int height = 0;
};

using SubscriberQueue = BoundedQueue<std::shared_ptr<const EncodedFrame>>;
using FrameEncoder = std::function<std::optional<std::string>(const Frame&, int quality)>;

struct StreamInfo {
    DeviceId cameraId = 0;
    std::string name;
    std::string url;
    bool running = false;
    int width = 0;
    int height = 0;
    double fps = 0.0;
    std::optional<std::string> error;
    std::optional<double> lastFrameAgeSeconds;
    int reconnectAttempts = 0;
    std::size_t subscribers = 0;
    std::uint64_t framesCaptured = 0;
};

class StreamBroadcaster;
struct StreamSession;

// Rate-limited pull of multipart JPEG parts from one stream.
// Ends for good once that stream is stopped or fails.
class LiveSequence {
public:
    // Next "--frame" multipart part; nullopt once the stream has ended
    std::optional<std::string> next();
    bool finished() const;

private:
    friend class StreamBroadcaster;
    struct State;
    explicit LiveSequence(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// One capture loop per device; fans the latest frame out to subscribers
class StreamBroadcaster {
public:
    explicit StreamBroadcaster(MediaSourceFactory sources, StreamOptions options = {},
                               EventBus* events = nullptr);
    ~StreamBroadcaster();

    StreamBroadcaster(const StreamBroadcaster&) = delete;
    StreamBroadcaster& operator=(const StreamBroadcaster&) = delete;

    // Idempotent while a loop for the device is alive
    bool startStream(DeviceId id, const std::string& url, const std::string& name = {});
    // Returns after the capture loop has exited and released its connection
    void stopStream(DeviceId id);
    void stopAll();

    std::shared_ptr<const Frame> getFrame(DeviceId id) const;
    std::optional<std::string> getSnapshotImage(DeviceId id, int quality = 80) const;
    std::optional<StreamInfo> getStreamInfo(DeviceId id) const;
    std::vector<StreamInfo> listStreams() const;

    // nullptr when the device has no stream
    std::shared_ptr<SubscriberQueue> subscribe(DeviceId id, const std::string& subscriberId);
    void unsubscribe(DeviceId id, const std::string& subscriberId);

    // nullopt when the device has no stream
    std::optional<LiveSequence> generateLiveSequence(DeviceId id, int fpsLimit = 15, int quality = 70);

    void setEncoder(FrameEncoder encoder);
    const StreamOptions& options() const { return options_; }

    static std::string multipartPart(const std::string& jpeg);

private:
    void captureLoop(std::shared_ptr<StreamSession> session);
    void deliver(StreamSession& session, Frame&& frame);
    void publishState(const StreamSession& session, const char* state);
    void logStream(DeviceId id, LogLevel level, const char* format, ...) const
        __attribute__((format(printf, 4, 5)));
    std::shared_ptr<StreamSession> findSession(DeviceId id) const;
    FrameEncoder encoder() const;

    MediaSourceFactory sources_;
    StreamOptions options_;
    EventBus* events_;

    mutable std::mutex encoderMutex_;
    FrameEncoder encoder_;

    mutable std::mutex sessionsMutex_;
    std::map<DeviceId, std::shared_ptr<StreamSession>> sessions_;
};

} // namespace cw
