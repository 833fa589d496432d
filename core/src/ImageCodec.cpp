// ImageCodec.cpp: still-image decode and JPEG encode through libavcodec
#include "cw/ImageCodec.hpp"
#include "cw/Log.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace cw {

namespace {

AVCodecID sniffCodec(const std::string& bytes) {
    auto b = reinterpret_cast<const unsigned char*>(bytes.data());
    if (bytes.size() >= 3 && b[0] == 0xFF && b[1] == 0xD8 && b[2] == 0xFF)
        return AV_CODEC_ID_MJPEG;
    if (bytes.size() >= 8 && std::memcmp(b, "\x89PNG\r\n\x1a\n", 8) == 0)
        return AV_CODEC_ID_PNG;
    if (bytes.size() >= 2 && b[0] == 'B' && b[1] == 'M')
        return AV_CODEC_ID_BMP;
    return AV_CODEC_ID_NONE;
}

// Frees the codec objects on every return path
struct CodecScope {
    AVCodecContext* ctx = nullptr;
    AVPacket* pkt = nullptr;
    AVFrame* frame = nullptr;
    ~CodecScope() {
        if (frame)
            av_frame_free(&frame);
        if (pkt)
            av_packet_free(&pkt);
        if (ctx)
            avcodec_free_context(&ctx);
    }
};

} // namespace

bool looksLikeImage(const std::string& bytes) {
    return sniffCodec(bytes) != AV_CODEC_ID_NONE;
}

bool looksLikeMultipartStream(const std::string& prefix, const std::string& contentType) {
    std::string type = contentType;
    std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c) { return std::tolower(c); });
    if (type.find("multipart/x-mixed-replace") != std::string::npos)
        return true;
    // Boundary marker followed by a part header
    auto boundary = prefix.find("--");
    if (boundary == std::string::npos)
        return false;
    return prefix.find("Content-Type", boundary) != std::string::npos ||
           prefix.find("Content-type", boundary) != std::string::npos ||
           prefix.find("content-type", boundary) != std::string::npos;
}

std::optional<Frame> decodeImage(const std::string& bytes) {
    AVCodecID id = sniffCodec(bytes);
    if (id == AV_CODEC_ID_NONE)
        return std::nullopt;
    const AVCodec* codec = avcodec_find_decoder(id);
    if (!codec) {
        log(LogLevel::Warn, "No decoder for %s", avcodec_get_name(id));
        return std::nullopt;
    }

    CodecScope s;
    s.ctx = avcodec_alloc_context3(codec);
    s.pkt = av_packet_alloc();
    s.frame = av_frame_alloc();
    if (!s.ctx || !s.pkt || !s.frame)
        return std::nullopt;
    if (avcodec_open2(s.ctx, codec, nullptr) < 0)
        return std::nullopt;

    if (av_new_packet(s.pkt, static_cast<int>(bytes.size())) < 0)
        return std::nullopt;
    std::memcpy(s.pkt->data, bytes.data(), bytes.size());

    if (avcodec_send_packet(s.ctx, s.pkt) < 0)
        return std::nullopt;
    avcodec_send_packet(s.ctx, nullptr); // flush
    if (avcodec_receive_frame(s.ctx, s.frame) < 0)
        return std::nullopt;

    const int w = s.frame->width;
    const int h = s.frame->height;
    if (w <= 0 || h <= 0)
        return std::nullopt;
    SwsContext* sws = sws_getContext(w, h, static_cast<AVPixelFormat>(s.frame->format), w, h,
                                     AV_PIX_FMT_YUV420P, SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!sws)
        return std::nullopt;

    Frame out;
    out.width = w;
    out.height = h;
    out.data.resize(Frame::bufferSize(w, h));
    uint8_t* dst[4];
    int dstStride[4];
    av_image_fill_arrays(dst, dstStride, out.data.data(), AV_PIX_FMT_YUV420P, w, h, 1);
    sws_scale(sws, s.frame->data, s.frame->linesize, 0, h, dst, dstStride);
    sws_freeContext(sws);
    return out;
}

std::optional<std::string> encodeJpeg(const Frame& frame, int quality) {
    if (frame.empty() || frame.data.size() < Frame::bufferSize(frame.width, frame.height))
        return std::nullopt;
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
    if (!codec) {
        log(LogLevel::Error, "MJPEG encoder not available");
        return std::nullopt;
    }

    CodecScope s;
    s.ctx = avcodec_alloc_context3(codec);
    s.pkt = av_packet_alloc();
    s.frame = av_frame_alloc();
    if (!s.ctx || !s.pkt || !s.frame)
        return std::nullopt;

    // Map 1..100 onto the MJPEG qscale range 31..2
    quality = std::clamp(quality, 1, 100);
    const int qscale = 2 + (100 - quality) * 29 / 99;

    s.ctx->width = frame.width;
    s.ctx->height = frame.height;
    s.ctx->pix_fmt = AV_PIX_FMT_YUVJ420P;
    s.ctx->time_base = AVRational{1, 25};
    s.ctx->flags |= AV_CODEC_FLAG_QSCALE;
    s.ctx->global_quality = qscale * FF_QP2LAMBDA;
    s.ctx->qmin = qscale;
    s.ctx->qmax = qscale;
    if (avcodec_open2(s.ctx, codec, nullptr) < 0) {
        log(LogLevel::Error, "Cannot open MJPEG encoder");
        return std::nullopt;
    }

    s.frame->format = AV_PIX_FMT_YUVJ420P;
    s.frame->width = frame.width;
    s.frame->height = frame.height;
    s.frame->quality = s.ctx->global_quality;
    s.frame->pts = 0;
    av_image_fill_arrays(s.frame->data, s.frame->linesize, frame.data.data(), AV_PIX_FMT_YUVJ420P,
                         frame.width, frame.height, 1);

    if (avcodec_send_frame(s.ctx, s.frame) < 0)
        return std::nullopt;
    if (avcodec_receive_packet(s.ctx, s.pkt) < 0)
        return std::nullopt;
    std::string out(reinterpret_cast<const char*>(s.pkt->data), static_cast<std::size_t>(s.pkt->size));
    av_packet_unref(s.pkt);
    return out;
}

} // namespace cw
