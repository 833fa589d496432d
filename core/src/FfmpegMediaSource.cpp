// FfmpegMediaSource.cpp: demux + decode + scale to YUV420P
#include "cw/MediaSource.hpp"
#include "cw/HttpClient.hpp"
#include "cw/Log.hpp"

#include <mutex>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace cw {

std::size_t Frame::bufferSize(int width, int height) {
    if (width <= 0 || height <= 0)
        return 0;
    int size = av_image_get_buffer_size(AV_PIX_FMT_YUV420P, width, height, 1);
    return size > 0 ? static_cast<std::size_t>(size) : 0;
}

namespace {

using Clock = std::chrono::steady_clock;

class FfmpegMediaSource : public MediaSource {
public:
    FfmpegMediaSource() {
        static std::once_flag once;
        std::call_once(once, [] { avformat_network_init(); });
    }

    ~FfmpegMediaSource() override { close(); }

    bool open(const std::string& url, std::chrono::milliseconds timeout) override {
        close();
        timeout_ = timeout;
        url_ = url;

        fmtCtx_ = avformat_alloc_context();
        if (!fmtCtx_)
            return fail(ErrorKind::Unreachable, "Failed to allocate format context");
        fmtCtx_->interrupt_callback.callback = &FfmpegMediaSource::interrupt;
        fmtCtx_->interrupt_callback.opaque = this;

        AVDictionary* opts = nullptr;
        const auto micros = std::to_string(
            std::chrono::duration_cast<std::chrono::microseconds>(timeout).count());
        if (url.rfind("rtsp://", 0) == 0 || url.rfind("rtsps://", 0) == 0) {
            av_dict_set(&opts, "rtsp_transport", "tcp", 0);
            av_dict_set(&opts, "max_delay", "500000", 0);
        }
        av_dict_set(&opts, "timeout", micros.c_str(), 0);
        av_dict_set(&opts, "rw_timeout", micros.c_str(), 0);
        av_dict_set(&opts, "fflags", "nobuffer", 0);

        armDeadline();
        int ret = avformat_open_input(&fmtCtx_, url.c_str(), nullptr, &opts);
        av_dict_free(&opts);
        if (ret < 0) {
            // avformat_open_input frees the context on failure
            fmtCtx_ = nullptr;
            return failAv(ret, "Cannot open stream");
        }

        armDeadline();
        ret = avformat_find_stream_info(fmtCtx_, nullptr);
        if (ret < 0)
            return failAv(ret, "Cannot read stream info");

        const AVCodec* codec = nullptr;
        videoIndex_ = av_find_best_stream(fmtCtx_, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
        if (videoIndex_ < 0 || !codec)
            return fail(videoIndex_ == AVERROR_DECODER_NOT_FOUND ? ErrorKind::DecodeFailure
                                                                 : ErrorKind::ProtocolMismatch,
                        "No video stream found");

        AVStream* stream = fmtCtx_->streams[videoIndex_];
        codecCtx_ = avcodec_alloc_context3(codec);
        if (!codecCtx_)
            return fail(ErrorKind::DecodeFailure, "Failed to allocate codec context");
        if (avcodec_parameters_to_context(codecCtx_, stream->codecpar) < 0)
            return fail(ErrorKind::DecodeFailure, "Failed to copy codec parameters");
        ret = avcodec_open2(codecCtx_, codec, nullptr);
        if (ret < 0)
            return fail(ErrorKind::DecodeFailure, "Cannot open decoder: " + avErrorString(ret));

        packet_ = av_packet_alloc();
        decoded_ = av_frame_alloc();
        if (!packet_ || !decoded_)
            return fail(ErrorKind::DecodeFailure, "Failed to allocate frame buffers");

        props_ = MediaProperties{};
        props_.resolution = Resolution{stream->codecpar->width, stream->codecpar->height};
        AVRational rate = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
        if (rate.num > 0 && rate.den > 0) {
            double fps = av_q2d(rate);
            if (fps > 0.0 && fps < 1000.0)
                props_.fps = fps;
        }
        props_.codec = std::string(avcodec_get_name(stream->codecpar->codec_id));
        timeBase_ = stream->time_base;
        errorKind_ = ErrorKind::None;
        error_.clear();
        return true;
    }

    bool read(Frame& frame) override {
        if (!fmtCtx_ || !codecCtx_)
            return fail(ErrorKind::Unreachable, "Stream not open");

        for (;;) {
            int ret = avcodec_receive_frame(codecCtx_, decoded_);
            if (ret == 0) {
                bool ok = convert(frame);
                av_frame_unref(decoded_);
                if (ok)
                    return true;
                continue;
            }
            if (ret != AVERROR(EAGAIN))
                return failAv(ret, "Decoder error");

            armDeadline();
            ret = av_read_frame(fmtCtx_, packet_);
            if (ret < 0) {
                if (ret == AVERROR_EOF)
                    return fail(ErrorKind::ProtocolMismatch, "End of stream reached");
                return failAv(ret, "Error reading frame");
            }
            if (packet_->stream_index != videoIndex_) {
                av_packet_unref(packet_);
                continue;
            }
            ret = avcodec_send_packet(codecCtx_, packet_);
            av_packet_unref(packet_);
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                log(LogLevel::Debug, "Dropping undecodable packet from %s: %s", url_.c_str(),
                    avErrorString(ret).c_str());
                if (++badPackets_ > 50)
                    return fail(ErrorKind::DecodeFailure, "Too many undecodable packets");
            }
        }
    }

    void close() override {
        if (swsCtx_) {
            sws_freeContext(swsCtx_);
            swsCtx_ = nullptr;
        }
        if (decoded_)
            av_frame_free(&decoded_);
        if (packet_)
            av_packet_free(&packet_);
        if (codecCtx_)
            avcodec_free_context(&codecCtx_);
        if (fmtCtx_)
            avformat_close_input(&fmtCtx_);
        videoIndex_ = -1;
        badPackets_ = 0;
    }

    void setStopFlag(const std::atomic<bool>* stop) override { stop_ = stop; }

    MediaProperties properties() const override { return props_; }
    ErrorKind lastErrorKind() const override { return errorKind_; }
    std::string lastError() const override { return error_; }

private:
    static int interrupt(void* opaque) {
        auto* self = static_cast<FfmpegMediaSource*>(opaque);
        if (self->stop_ && self->stop_->load())
            return 1;
        return Clock::now() >= self->deadline_ ? 1 : 0;
    }

    void armDeadline() { deadline_ = Clock::now() + timeout_; }

    bool fail(ErrorKind kind, const std::string& message) {
        errorKind_ = kind;
        error_ = message;
        return false;
    }

    bool failAv(int averror, const std::string& context) {
        if (averror == AVERROR_EXIT)
            return fail(ErrorKind::Unreachable,
                        context + (stop_ && stop_->load() ? ": interrupted" : ": timed out"));
        return fail(classifyAvError(averror), context + ": " + avErrorString(averror));
    }

    bool convert(Frame& frame) {
        const int w = decoded_->width;
        const int h = decoded_->height;
        if (w <= 0 || h <= 0)
            return false;
        swsCtx_ = sws_getCachedContext(swsCtx_, w, h, static_cast<AVPixelFormat>(decoded_->format),
                                       w, h, AV_PIX_FMT_YUV420P, SWS_BILINEAR, nullptr, nullptr,
                                       nullptr);
        if (!swsCtx_) {
            log(LogLevel::Warn, "Cannot convert pixel format %d", decoded_->format);
            return false;
        }
        frame.width = w;
        frame.height = h;
        frame.data.resize(Frame::bufferSize(w, h));
        uint8_t* dst[4];
        int dstStride[4];
        av_image_fill_arrays(dst, dstStride, frame.data.data(), AV_PIX_FMT_YUV420P, w, h, 1);
        sws_scale(swsCtx_, decoded_->data, decoded_->linesize, 0, h, dst, dstStride);
        if (decoded_->best_effort_timestamp != AV_NOPTS_VALUE)
            frame.ptsUsec = av_rescale_q(decoded_->best_effort_timestamp, timeBase_, AVRational{1, 1000000});
        props_.resolution = Resolution{w, h};
        return true;
    }

    AVFormatContext* fmtCtx_ = nullptr;
    AVCodecContext* codecCtx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* decoded_ = nullptr;
    SwsContext* swsCtx_ = nullptr;
    int videoIndex_ = -1;
    int badPackets_ = 0;
    AVRational timeBase_{1, 90000};

    std::string url_;
    std::chrono::milliseconds timeout_{5000};
    Clock::time_point deadline_{};
    const std::atomic<bool>* stop_ = nullptr;
    MediaProperties props_;
    ErrorKind errorKind_ = ErrorKind::None;
    std::string error_;
};

} // namespace

std::unique_ptr<MediaSource> makeFfmpegMediaSource() {
    return std::make_unique<FfmpegMediaSource>();
}

MediaSourceFactory ffmpegMediaSourceFactory() {
    return [] { return makeFfmpegMediaSource(); };
}

} // namespace cw
