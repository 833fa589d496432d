// ConnectionTester.cpp: per-kind connection probes and priority auto-detection
#include "cw/ConnectionTester.hpp"
#include "cw/Log.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

namespace cw {

namespace {

using Clock = std::chrono::steady_clock;

double millisSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

ConnectionTestResult failure(ConnectionKind kind, const std::string& url, ErrorKind errorKind,
                             std::string message) {
    ConnectionTestResult r;
    r.success = false;
    r.kind = kind;
    r.url = url;
    r.errorKind = errorKind;
    r.error = std::move(message);
    return r;
}

std::string httpFailureText(const HttpResponse& response) {
    if (response.status >= 400)
        return "HTTP " + std::to_string(response.status);
    return response.error.value_or("request failed");
}

bool containsNoCase(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) ==
                                                      std::tolower(static_cast<unsigned char>(b)); });
    return it != haystack.end();
}

} // namespace

ConnectionTester::ConnectionTester(const ProfileCatalog& catalog, std::shared_ptr<HttpClient> http,
                                   MediaSourceFactory sources, ConnectionOptions options)
    : catalog_(catalog), http_(std::move(http)), sources_(std::move(sources)),
      options_(std::move(options)), decoder_(&decodeImage) {}

ConnectionTester::ConnectionTester(const ProfileCatalog& catalog, ConnectionOptions options)
    : catalog_(catalog), options_(std::move(options)), decoder_(&decodeImage) {}

ConnectionTestResult ConnectionTester::testStreamingUrl(const std::string& url) {
    const auto start = Clock::now();
    auto source = sources_ ? sources_() : nullptr;
    if (!source)
        return failure(ConnectionKind::Stream, url, ErrorKind::Unreachable, "No media backend available");

    if (!source->open(url, options_.timeout)) {
        auto r = failure(ConnectionKind::Stream, url, source->lastErrorKind(),
                         "Cannot open stream: " + source->lastError());
        if (r.errorKind == ErrorKind::None)
            r.errorKind = ErrorKind::Unreachable;
        return r;
    }

    Frame frame;
    if (!source->read(frame)) {
        auto kind = source->lastErrorKind();
        auto r = failure(ConnectionKind::Stream, url,
                         kind == ErrorKind::None || kind == ErrorKind::Unreachable
                             ? ErrorKind::ProtocolMismatch : kind,
                         "Cannot read frame from stream: " + source->lastError());
        source->close();
        return r;
    }

    MediaProperties props = source->properties();
    source->close();

    ConnectionTestResult r;
    r.success = true;
    r.kind = ConnectionKind::Stream;
    r.url = url;
    r.responseTimeMs = millisSince(start);
    Resolution res = props.resolution;
    if (res.width <= 0 || res.height <= 0)
        res = Resolution{frame.width, frame.height};
    if (res.width > 0 && res.height > 0)
        r.resolution = res;
    r.fps = props.fps;
    r.codec = props.codec;
    return r;
}

ConnectionTestResult ConnectionTester::testHttpImageUrl(const std::string& url, const std::string& username,
                                                        const std::string& password) {
    if (!http_)
        return failure(ConnectionKind::HttpImage, url, ErrorKind::Unreachable, "No HTTP client available");

    HttpRequest request;
    request.url = url;
    request.timeout = options_.timeout;
    request.maxBytes = options_.httpPrefixBytes;
    if (!username.empty())
        request.credentials = Credentials{username, password};

    const auto start = Clock::now();
    HttpResponse response = http_->fetch(request);
    if (!response.ok())
        return failure(ConnectionKind::HttpImage, url,
                       response.errorKind == ErrorKind::None ? ErrorKind::ProtocolMismatch
                                                             : response.errorKind,
                       httpFailureText(response));

    if (!looksLikeMultipartStream(response.body, response.contentType))
        return failure(ConnectionKind::HttpImage, url, ErrorKind::ProtocolMismatch,
                       "Not a valid MJPEG stream");

    ConnectionTestResult r;
    r.success = true;
    r.kind = ConnectionKind::HttpImage;
    r.url = url;
    r.responseTimeMs = millisSince(start);
    r.codec = std::string("mjpeg");
    return r;
}

ConnectionTestResult ConnectionTester::testSnapshotUrl(const std::string& url, const std::string& username,
                                                       const std::string& password) {
    if (!http_)
        return failure(ConnectionKind::Snapshot, url, ErrorKind::Unreachable, "No HTTP client available");

    HttpRequest request;
    request.url = url;
    request.timeout = options_.timeout;
    request.maxBytes = options_.snapshotMaxBytes;
    if (!username.empty())
        request.credentials = Credentials{username, password};

    const auto start = Clock::now();
    HttpResponse response = http_->fetch(request);
    if (!response.ok())
        return failure(ConnectionKind::Snapshot, url,
                       response.errorKind == ErrorKind::None ? ErrorKind::ProtocolMismatch
                                                             : response.errorKind,
                       httpFailureText(response));

    // Some firmware omits the header; accept recognisable image bytes instead
    if (!containsNoCase(response.contentType, "image") && !looksLikeImage(response.body))
        return failure(ConnectionKind::Snapshot, url, ErrorKind::ProtocolMismatch,
                       "Not an image: " + response.contentType);

    auto image = decoder_ ? decoder_(response.body) : std::nullopt;
    if (!image || image->width <= 0 || image->height <= 0)
        return failure(ConnectionKind::Snapshot, url, ErrorKind::DecodeFailure, "Cannot decode image");

    ConnectionTestResult r;
    r.success = true;
    r.kind = ConnectionKind::Snapshot;
    r.url = url;
    r.responseTimeMs = millisSince(start);
    r.resolution = Resolution{image->width, image->height};
    return r;
}

AutoDetectOutcome ConnectionTester::autoDetectBestConnection(const std::string& ip,
                                                             const std::string& username,
                                                             const std::string& password,
                                                             const std::string& vendorHint) {
    AutoDetectOutcome outcome;
    CandidateUrls urls = catalog_.expandUrls(vendorHint, ip, username, password,
                                             options_.channel, options_.stream);

    const ConnectionKind order[] = {ConnectionKind::Stream, ConnectionKind::HttpImage,
                                    ConnectionKind::Snapshot};
    for (ConnectionKind kind : order) {
        for (const auto& url : urls.forKind(kind)) {
            if (!outcome.all.empty() && options_.pause.count() > 0)
                std::this_thread::sleep_for(options_.pause);

            ConnectionTestResult result;
            switch (kind) {
                case ConnectionKind::Stream: result = testStreamingUrl(url); break;
                case ConnectionKind::HttpImage: result = testHttpImageUrl(url, username, password); break;
                case ConnectionKind::Snapshot: result = testSnapshotUrl(url, username, password); break;
            }
            outcome.all.push_back(result);

            if (result.success) {
                log(LogLevel::Info, "%s connection successful for %s: %s", toString(kind), ip.c_str(),
                    url.c_str());
                outcome.best = result;
                return outcome;
            }
            if (result.errorKind == ErrorKind::AuthenticationRequired) {
                log(LogLevel::Warn, "Authentication rejected by %s for %s, skipping remaining %s candidates",
                    ip.c_str(), url.c_str(), toString(kind));
                break;
            }
            log(LogLevel::Debug, "%s candidate failed for %s: %s", toString(kind), url.c_str(),
                result.error.value_or("").c_str());
        }
    }

    log(LogLevel::Warn, "No successful connection found for %s after %zu attempt(s)", ip.c_str(),
        outcome.all.size());
    return outcome;
}

HealthCheckResult ConnectionTester::checkHealth(const std::string& url, ConnectionKind kind,
                                                const std::string& username,
                                                const std::string& password) {
    ConnectionTestResult test;
    switch (kind) {
        case ConnectionKind::Stream: test = testStreamingUrl(url); break;
        case ConnectionKind::HttpImage: test = testHttpImageUrl(url, username, password); break;
        case ConnectionKind::Snapshot: test = testSnapshotUrl(url, username, password); break;
    }

    HealthCheckResult health;
    health.online = test.success;
    health.responseTimeMs = test.responseTimeMs;
    health.tier = healthTierFor(test.success, test.responseTimeMs);
    if (test.success) {
        health.resolution = test.resolution;
        health.fps = test.fps;
    } else {
        health.error = test.error;
        health.errorKind = test.errorKind;
    }
    return health;
}

} // namespace cw
