#pragma once

#include "cw/Types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cw {

struct HttpRequest {
    std::string url;
    std::string method = "GET";
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<Credentials> credentials;
    std::chrono::milliseconds timeout{5000};
    std::size_t maxBytes = 8 * 1024 * 1024; // stop reading after this many bytes
};

struct HttpResponse {
    int status = 0; // 0 when no HTTP response was received
    std::string contentType;
    std::string body;
    bool truncated = false;
    double elapsedMs = 0.0;
    ErrorKind errorKind = ErrorKind::None;
    std::optional<std::string> error;

    bool ok() const { return errorKind == ErrorKind::None && status >= 200 && status < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse fetch(const HttpRequest& request) = 0;
};

// HTTP over FFmpeg's protocol layer (avio)
class AvioHttpClient : public HttpClient {
public:
    AvioHttpClient();
    HttpResponse fetch(const HttpRequest& request) override;
};

// Insert percent-encoded credentials into the authority of a URL
std::string withCredentials(const std::string& url, const Credentials& credentials);

// Map an FFmpeg error code onto the failure taxonomy; sets status for HTTP errors
ErrorKind classifyAvError(int averror, int* httpStatus = nullptr);
std::string avErrorString(int averror);

} // namespace cw
