#pragma once

#include "cw/Types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw {

// Decoded picture, planar YUV420P (Y plane, then U, then V)
struct Frame {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> data;
    std::int64_t ptsUsec = 0;
    std::uint64_t sequence = 0;

    bool empty() const { return width <= 0 || height <= 0 || data.empty(); }
    static std::size_t bufferSize(int width, int height);
};

struct MediaProperties {
    Resolution resolution;
    std::optional<double> fps;
    std::optional<std::string> codec;
};

// One open connection to a stream; not thread-safe
class MediaSource {
public:
    virtual ~MediaSource() = default;

    virtual bool open(const std::string& url, std::chrono::milliseconds timeout) = 0;
    // Blocks until one decoded frame is available; false on EOF or error
    virtual bool read(Frame& frame) = 0;
    virtual void close() = 0;
    // Blocking open() and read() give up once *stop becomes true
    virtual void setStopFlag(const std::atomic<bool>* stop) { (void)stop; }

    virtual MediaProperties properties() const = 0;
    virtual ErrorKind lastErrorKind() const = 0;
    virtual std::string lastError() const = 0;
};

using MediaSourceFactory = std::function<std::unique_ptr<MediaSource>()>;

// libavformat/libavcodec backed source; RTSP forced over TCP
std::unique_ptr<MediaSource> makeFfmpegMediaSource();
MediaSourceFactory ffmpegMediaSourceFactory();

} // namespace cw
