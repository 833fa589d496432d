// HttpClient.cpp: request/response over libavformat's http protocol
#include "cw/HttpClient.hpp"
#include "cw/Log.hpp"
#include "cw/ProfileCatalog.hpp"

#include <algorithm>
#include <mutex>

extern "C" {
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavutil/opt.h>
}

namespace cw {

namespace {

using Clock = std::chrono::steady_clock;

struct Deadline {
    Clock::time_point until;
};

int interruptOnDeadline(void* opaque) {
    auto* d = static_cast<Deadline*>(opaque);
    return Clock::now() >= d->until ? 1 : 0;
}

std::string toHex(const std::string& data) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (unsigned char c : data) {
        out.push_back(hex[c >> 4]);
        out.push_back(hex[c & 0x0F]);
    }
    return out;
}

double millisSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

} // namespace

std::string avErrorString(int averror) {
    char buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(averror, buf, sizeof(buf));
    return buf;
}

ErrorKind classifyAvError(int averror, int* httpStatus) {
    int status = 0;
    ErrorKind kind = ErrorKind::Unreachable;
    switch (averror) {
        case AVERROR_HTTP_UNAUTHORIZED:
            status = 401;
            kind = ErrorKind::AuthenticationRequired;
            break;
        case AVERROR_HTTP_FORBIDDEN:
            status = 403;
            kind = ErrorKind::AuthenticationRequired;
            break;
        case AVERROR_HTTP_NOT_FOUND:
            status = 404;
            kind = ErrorKind::ProtocolMismatch;
            break;
        case AVERROR_HTTP_BAD_REQUEST:
            status = 400;
            kind = ErrorKind::ProtocolMismatch;
            break;
        case AVERROR_HTTP_OTHER_4XX:
            status = 499;
            kind = ErrorKind::ProtocolMismatch;
            break;
        case AVERROR_HTTP_SERVER_ERROR:
            status = 500;
            kind = ErrorKind::ProtocolMismatch;
            break;
        case AVERROR_INVALIDDATA:
        case AVERROR_PROTOCOL_NOT_FOUND:
        case AVERROR_DEMUXER_NOT_FOUND:
        case AVERROR_STREAM_NOT_FOUND:
        case AVERROR_EOF:
            kind = ErrorKind::ProtocolMismatch;
            break;
        case AVERROR_DECODER_NOT_FOUND:
            kind = ErrorKind::DecodeFailure;
            break;
        default:
            kind = ErrorKind::Unreachable;
            break;
    }
    if (httpStatus)
        *httpStatus = status;
    return kind;
}

std::string withCredentials(const std::string& url, const Credentials& credentials) {
    if (credentials.username.empty())
        return url;
    auto scheme = url.find("://");
    if (scheme == std::string::npos)
        return url;
    std::size_t hostStart = scheme + 3;
    std::size_t hostEnd = url.find_first_of("/?#", hostStart);
    std::string authority = url.substr(hostStart, hostEnd == std::string::npos ? std::string::npos
                                                                                : hostEnd - hostStart);
    if (authority.find('@') != std::string::npos)
        return url; // already carries userinfo
    std::string userinfo = percentEncode(credentials.username);
    if (!credentials.password.empty())
        userinfo += ":" + percentEncode(credentials.password);
    return url.substr(0, hostStart) + userinfo + "@" + url.substr(hostStart);
}

AvioHttpClient::AvioHttpClient() {
    static std::once_flag once;
    std::call_once(once, [] { avformat_network_init(); });
}

HttpResponse AvioHttpClient::fetch(const HttpRequest& request) {
    HttpResponse response;
    const auto start = Clock::now();

    std::string url = request.credentials ? withCredentials(request.url, *request.credentials)
                                          : request.url;

    AVDictionary* opts = nullptr;
    const auto micros = std::to_string(
        std::chrono::duration_cast<std::chrono::microseconds>(request.timeout).count());
    av_dict_set(&opts, "timeout", micros.c_str(), 0);
    av_dict_set(&opts, "rw_timeout", micros.c_str(), 0);
    av_dict_set(&opts, "method", request.method.c_str(), 0);
    av_dict_set(&opts, "user_agent", "camwatch", 0);
    if (!request.body.empty())
        av_dict_set(&opts, "post_data", toHex(request.body).c_str(), 0);
    if (!request.contentType.empty())
        av_dict_set(&opts, "content_type", request.contentType.c_str(), 0);
    if (!request.headers.empty()) {
        std::string headers;
        for (const auto& [name, value] : request.headers)
            headers += name + ": " + value + "\r\n";
        av_dict_set(&opts, "headers", headers.c_str(), 0);
    }

    Deadline deadline{start + request.timeout};
    AVIOInterruptCB interrupt{interruptOnDeadline, &deadline};

    AVIOContext* io = nullptr;
    int ret = avio_open2(&io, url.c_str(), AVIO_FLAG_READ, &interrupt, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        response.errorKind = classifyAvError(ret, &response.status);
        if (ret == AVERROR_EXIT)
            response.error = "timed out";
        else
            response.error = avErrorString(ret);
        response.elapsedMs = millisSince(start);
        log(LogLevel::Debug, "HTTP %s %s failed: %s", request.method.c_str(), request.url.c_str(),
            response.error->c_str());
        return response;
    }

    response.status = 200;
    uint8_t* mime = nullptr;
    if (av_opt_get(io, "mime_type", AV_OPT_SEARCH_CHILDREN, &mime) >= 0 && mime) {
        response.contentType = reinterpret_cast<const char*>(mime);
        av_free(mime);
    }

    unsigned char chunk[4096];
    while (response.body.size() < request.maxBytes) {
        int want = static_cast<int>(std::min<std::size_t>(sizeof(chunk),
                                                          request.maxBytes - response.body.size()));
        int n = avio_read(io, chunk, want);
        if (n == AVERROR_EOF || n == 0)
            break;
        if (n < 0) {
            // A timed-out read after some payload still counts as a response
            if (response.body.empty()) {
                response.errorKind = n == AVERROR_EXIT ? ErrorKind::Unreachable
                                                       : classifyAvError(n);
                response.error = n == AVERROR_EXIT ? "timed out" : avErrorString(n);
            }
            break;
        }
        response.body.append(reinterpret_cast<const char*>(chunk), static_cast<std::size_t>(n));
    }
    if (response.body.size() >= request.maxBytes)
        response.truncated = true;

    avio_closep(&io);
    response.elapsedMs = millisSince(start);
    return response;
}

} // namespace cw
