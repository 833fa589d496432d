#include "cw/StreamBroadcaster.hpp"
#include "cw/ImageCodec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdarg>
#include <cstdio>

namespace cw {

using Clock = std::chrono::steady_clock;

struct StreamSession {
    DeviceId id = 0;
    std::string url;
    std::string name;

    std::atomic<bool> stop{false};
    std::atomic<bool> running{false};
    std::atomic<bool> finished{false};
    std::thread thread;

    // Everything below is guarded by mutex; cv signals new frames and shutdown
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::shared_ptr<const Frame> frame;
    int width = 0;
    int height = 0;
    double fps = 0.0;
    std::optional<std::string> error;
    std::optional<Clock::time_point> lastFrameTime;
    int reconnectAttempts = 0;
    std::uint64_t framesCaptured = 0;
    std::uint64_t sequence = 0;
    Clock::time_point fpsWindowStart;
    std::uint64_t fpsWindowFrames = 0;
    std::map<std::string, std::shared_ptr<SubscriberQueue>> subscribers;
};

struct LiveSequence::State {
    std::shared_ptr<StreamSession> session;
    FrameEncoder encode;
    std::chrono::microseconds minInterval{0};
    int quality = 70;
    std::optional<Clock::time_point> lastSent;
    std::uint64_t lastSequence = 0;
    bool done = false;
};

std::optional<std::string> LiveSequence::next() {
    if (!state_ || state_->done)
        return std::nullopt;
    State& st = *state_;
    StreamSession& s = *st.session;

    for (;;) {
        if (s.stop || s.finished) {
            st.done = true;
            return std::nullopt;
        }
        if (st.lastSent) {
            auto wait = *st.lastSent + st.minInterval - Clock::now();
            if (wait > Clock::duration::zero()) {
                std::this_thread::sleep_for(std::min<Clock::duration>(wait, std::chrono::milliseconds(10)));
                continue;
            }
        }

        std::shared_ptr<const Frame> frame;
        {
            std::unique_lock<std::mutex> lock(s.mutex);
            s.cv.wait_for(lock, std::chrono::milliseconds(100), [&] {
                return s.stop || s.finished || (s.frame && s.frame->sequence != st.lastSequence);
            });
            if (s.frame && s.frame->sequence != st.lastSequence)
                frame = s.frame;
        }
        if (!frame)
            continue;

        st.lastSequence = frame->sequence;
        auto jpeg = st.encode(*frame, st.quality);
        if (!jpeg)
            continue;
        st.lastSent = Clock::now();
        return StreamBroadcaster::multipartPart(*jpeg);
    }
}

bool LiveSequence::finished() const {
    if (!state_ || state_->done)
        return true;
    return state_->session->stop || state_->session->finished;
}

StreamBroadcaster::StreamBroadcaster(MediaSourceFactory sources, StreamOptions options, EventBus* events)
    : sources_(std::move(sources)), options_(std::move(options)), events_(events) {
    encoder_ = [](const Frame& frame, int quality) { return encodeJpeg(frame, quality); };
}

StreamBroadcaster::~StreamBroadcaster() {
    stopAll();
}

bool StreamBroadcaster::startStream(DeviceId id, const std::string& url, const std::string& name) {
    if (url.empty() || !sources_) {
        log(LogLevel::Error, "Cannot start stream %lld: %s", static_cast<long long>(id),
            url.empty() ? "empty URL" : "no media source factory");
        return false;
    }

    std::shared_ptr<StreamSession> previous;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(id);
        if (it != sessions_.end()) {
            if (!it->second->finished) {
                logStream(id, LogLevel::Debug, "Already running");
                return true;
            }
            previous = it->second;
            sessions_.erase(it);
        }

        auto session = std::make_shared<StreamSession>();
        session->id = id;
        session->url = url;
        session->name = name.empty() ? "Camera " + std::to_string(id) : name;
        session->fpsWindowStart = Clock::now();
        sessions_[id] = session;
        session->thread = std::thread(&StreamBroadcaster::captureLoop, this, session);
    }

    if (previous && previous->thread.joinable())
        previous->thread.join();
    return true;
}

void StreamBroadcaster::stopStream(DeviceId id) {
    std::shared_ptr<StreamSession> session;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end())
            return;
        session = it->second;
        sessions_.erase(it);
    }

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->stop = true;
    }
    session->cv.notify_all();
    if (session->thread.joinable())
        session->thread.join();

    publishState(*session, "stopped");
    logStream(id, LogLevel::Info, "Stopped");
}

void StreamBroadcaster::stopAll() {
    std::vector<DeviceId> ids;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (const auto& [id, session] : sessions_)
            ids.push_back(id);
    }
    for (DeviceId id : ids)
        stopStream(id);
}

void StreamBroadcaster::captureLoop(std::shared_ptr<StreamSession> session) {
    StreamSession& s = *session;
    logStream(s.id, LogLevel::Info, "Starting capture loop for %s", s.url.c_str());

    while (!s.stop) {
        std::unique_ptr<MediaSource> source = sources_();
        std::string failure;

        if (source)
            source->setStopFlag(&s.stop);

        if (!source) {
            failure = "no media source available";
        } else if (source->open(s.url, options_.openTimeout)) {
            MediaProperties props = source->properties();
            {
                std::lock_guard<std::mutex> lock(s.mutex);
                s.reconnectAttempts = 0;
                s.error.reset();
                s.width = props.resolution.width;
                s.height = props.resolution.height;
                if (props.fps)
                    s.fps = *props.fps;
            }
            s.running = true;
            logStream(s.id, LogLevel::Info, "Connected (%dx%d)", props.resolution.width,
                      props.resolution.height);
            publishState(s, "connected");

            Frame frame;
            while (!s.stop && source->read(frame)) {
                deliver(s, std::move(frame));
                frame = Frame{};
            }
            s.running = false;
            if (s.stop) {
                source->close();
                break;
            }
            failure = source->lastError().empty() ? "stream ended" : source->lastError();
            logStream(s.id, LogLevel::Warn, "Error reading frame: %s", failure.c_str());
        } else {
            failure = source->lastError().empty() ? "failed to open stream" : source->lastError();
            logStream(s.id, LogLevel::Warn, "Open failed: %s", failure.c_str());
        }
        if (source)
            source->close();

        int attempts = 0;
        {
            std::lock_guard<std::mutex> lock(s.mutex);
            attempts = ++s.reconnectAttempts;
            s.error = failure;
            if (options_.maxReconnectAttempts > 0 && attempts >= options_.maxReconnectAttempts)
                s.error = "Max reconnection attempts reached";
        }
        if (options_.maxReconnectAttempts > 0 && attempts >= options_.maxReconnectAttempts) {
            logStream(s.id, LogLevel::Error, "Max reconnection attempts reached, stopping stream");
            publishState(s, "failed");
            break;
        }

        logStream(s.id, LogLevel::Warn, "Reconnecting in %lld ms (attempt %d)",
                  static_cast<long long>(options_.reconnectDelay.count()), attempts);
        publishState(s, "reconnecting");

        std::unique_lock<std::mutex> lock(s.mutex);
        s.cv.wait_for(lock, options_.reconnectDelay, [&] { return s.stop.load(); });
    }

    std::vector<std::shared_ptr<SubscriberQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        s.running = false;
        s.finished = true;
        for (const auto& [subscriberId, queue] : s.subscribers)
            queues.push_back(queue);
    }
    s.cv.notify_all();
    for (auto& queue : queues)
        queue->close();

    logStream(s.id, LogLevel::Info, "Capture loop ended");
}

void StreamBroadcaster::deliver(StreamSession& s, Frame&& frame) {
    auto now = Clock::now();
    std::shared_ptr<const Frame> stored;
    std::vector<std::shared_ptr<SubscriberQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        frame.sequence = ++s.sequence;
        ++s.framesCaptured;
        ++s.fpsWindowFrames;
        double window = std::chrono::duration<double>(now - s.fpsWindowStart).count();
        if (window >= 1.0) {
            s.fps = s.fpsWindowFrames / window;
            s.fpsWindowStart = now;
            s.fpsWindowFrames = 0;
        }
        s.width = frame.width;
        s.height = frame.height;
        stored = std::make_shared<const Frame>(std::move(frame));
        s.frame = stored;
        s.lastFrameTime = now;
        for (const auto& [subscriberId, queue] : s.subscribers)
            queues.push_back(queue);
    }
    s.cv.notify_all();

    if (queues.empty())
        return;

    // Encoded once and shared by every subscriber
    auto jpeg = encoder()(*stored, options_.jpegQuality);
    if (!jpeg) {
        logStream(s.id, LogLevel::Debug, "Frame %llu could not be encoded",
                  static_cast<unsigned long long>(stored->sequence));
        return;
    }
    auto encoded = std::make_shared<const EncodedFrame>(
        EncodedFrame{std::move(*jpeg), stored->sequence, stored->width, stored->height});
    for (auto& queue : queues)
        queue->tryPush(encoded);
}

std::shared_ptr<const Frame> StreamBroadcaster::getFrame(DeviceId id) const {
    auto session = findSession(id);
    if (!session)
        return nullptr;
    std::lock_guard<std::mutex> lock(session->mutex);
    return session->frame;
}

std::optional<std::string> StreamBroadcaster::getSnapshotImage(DeviceId id, int quality) const {
    auto frame = getFrame(id);
    if (!frame)
        return std::nullopt;
    return encoder()(*frame, quality);
}

std::optional<StreamInfo> StreamBroadcaster::getStreamInfo(DeviceId id) const {
    auto session = findSession(id);
    if (!session)
        return std::nullopt;

    const StreamSession& s = *session;
    StreamInfo info;
    info.cameraId = s.id;
    info.name = s.name;
    info.url = s.url;
    info.running = s.running;
    std::lock_guard<std::mutex> lock(s.mutex);
    info.width = s.width;
    info.height = s.height;
    info.fps = s.fps;
    info.error = s.error;
    if (s.lastFrameTime)
        info.lastFrameAgeSeconds = std::chrono::duration<double>(Clock::now() - *s.lastFrameTime).count();
    info.reconnectAttempts = s.reconnectAttempts;
    info.subscribers = s.subscribers.size();
    info.framesCaptured = s.framesCaptured;
    return info;
}

std::vector<StreamInfo> StreamBroadcaster::listStreams() const {
    std::vector<DeviceId> ids;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (const auto& [id, session] : sessions_)
            ids.push_back(id);
    }
    std::vector<StreamInfo> out;
    for (DeviceId id : ids) {
        if (auto info = getStreamInfo(id))
            out.push_back(std::move(*info));
    }
    return out;
}

std::shared_ptr<SubscriberQueue> StreamBroadcaster::subscribe(DeviceId id, const std::string& subscriberId) {
    auto session = findSession(id);
    if (!session)
        return nullptr;

    std::lock_guard<std::mutex> lock(session->mutex);
    auto it = session->subscribers.find(subscriberId);
    if (it != session->subscribers.end())
        return it->second;

    auto queue = std::make_shared<SubscriberQueue>(options_.queueSize, options_.overflow);
    if (session->finished)
        queue->close();
    else
        session->subscribers[subscriberId] = queue;
    logStream(id, LogLevel::Debug, "Subscriber %s added", subscriberId.c_str());
    return queue;
}

void StreamBroadcaster::unsubscribe(DeviceId id, const std::string& subscriberId) {
    auto session = findSession(id);
    if (!session)
        return;

    std::shared_ptr<SubscriberQueue> queue;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto it = session->subscribers.find(subscriberId);
        if (it == session->subscribers.end())
            return;
        queue = it->second;
        session->subscribers.erase(it);
    }
    queue->close();
    logStream(id, LogLevel::Debug, "Subscriber %s removed", subscriberId.c_str());
}

std::optional<LiveSequence> StreamBroadcaster::generateLiveSequence(DeviceId id, int fpsLimit, int quality) {
    auto session = findSession(id);
    if (!session)
        return std::nullopt;

    auto state = std::make_shared<LiveSequence::State>();
    state->session = std::move(session);
    state->encode = encoder();
    state->quality = quality;
    if (fpsLimit > 0)
        state->minInterval = std::chrono::microseconds(1000000 / fpsLimit);
    return LiveSequence(std::move(state));
}

void StreamBroadcaster::setEncoder(FrameEncoder encoder) {
    std::lock_guard<std::mutex> lock(encoderMutex_);
    if (encoder)
        encoder_ = std::move(encoder);
    else
        encoder_ = [](const Frame& frame, int quality) { return encodeJpeg(frame, quality); };
}

FrameEncoder StreamBroadcaster::encoder() const {
    std::lock_guard<std::mutex> lock(encoderMutex_);
    return encoder_;
}

std::string StreamBroadcaster::multipartPart(const std::string& jpeg) {
    std::string part = "--frame\r\nContent-Type: image/jpeg\r\n\r\n";
    part.reserve(part.size() + jpeg.size() + 2);
    part += jpeg;
    part += "\r\n";
    return part;
}

std::shared_ptr<StreamSession> StreamBroadcaster::findSession(DeviceId id) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

void StreamBroadcaster::publishState(const StreamSession& s, const char* state) {
    if (!events_)
        return;
    nlohmann::json evt = {
        {"event", kStreamStateChannel},
        {"camera_id", s.id},
        {"name", s.name},
        {"state", state},
    };
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        evt["reconnect_attempts"] = s.reconnectAttempts;
        if (s.error)
            evt["error"] = *s.error;
    }
    events_->publish(kStreamStateChannel, evt.dump());
}

void StreamBroadcaster::logStream(DeviceId id, LogLevel level, const char* format, ...) const {
    char msg[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(msg, sizeof(msg), format, args);
    va_end(args);
    log(level, "[Stream %lld] %s", static_cast<long long>(id), msg);
}

} // namespace cw
