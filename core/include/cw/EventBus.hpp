#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cw {

// Thread-safe in-process publish/subscribe bus; one per service instance
class EventBus {
public:
    using Callback = std::function<void(const std::string&)>;
    using Token = std::uint64_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Subscribe a callback to a channel
    Token subscribe(const std::string& channel, Callback cb);
    void unsubscribe(Token token);

    // Publish a message to a channel; callbacks run on the publisher's thread
    void publish(const std::string& channel, const std::string& message);

    std::size_t subscriberCount(const std::string& channel) const;

private:
    struct Entry {
        Token token;
        Callback cb;
    };

    std::unordered_map<std::string, std::vector<Entry>> subscribers_;
    mutable std::mutex mutex_;
    Token nextToken_ = 1;
};

// Channel names
inline constexpr const char* kCameraStatusChannel = "camera.status";
inline constexpr const char* kStreamStateChannel = "stream.state";

} // namespace cw
