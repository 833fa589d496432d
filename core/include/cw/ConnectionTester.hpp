#pragma once

#include "cw/HttpClient.hpp"
#include "cw/ImageCodec.hpp"
#include "cw/MediaSource.hpp"
#include "cw/ProfileCatalog.hpp"
#include "cw/Types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cw {

struct ConnectionOptions {
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds pause{500};     // between candidate attempts
    std::size_t httpPrefixBytes = 2048;       // bytes read when checking a multipart stream
    std::size_t snapshotMaxBytes = 16 * 1024 * 1024;
    int channel = 1;
    int stream = 1;
};

struct AutoDetectOutcome {
    std::optional<ConnectionTestResult> best;
    std::vector<ConnectionTestResult> all;
};

using ImageDecoder = std::function<std::optional<Frame>(const std::string&)>;

// Tries candidate URLs of each connection kind and reports what worked
class ConnectionTester {
public:
    ConnectionTester(const ProfileCatalog& catalog, std::shared_ptr<HttpClient> http,
                     MediaSourceFactory sources, ConnectionOptions options = {});
    virtual ~ConnectionTester() = default;

    // Open, decode one frame, record resolution/fps/codec, close
    virtual ConnectionTestResult testStreamingUrl(const std::string& url);
    // Read a bounded prefix and check for multipart image content
    virtual ConnectionTestResult testHttpImageUrl(const std::string& url, const std::string& username,
                                                  const std::string& password);
    // Single GET that must return a decodable image
    virtual ConnectionTestResult testSnapshotUrl(const std::string& url, const std::string& username,
                                                 const std::string& password);

    // Stream, then HTTP image, then snapshot; first success wins.
    // An authentication failure skips the remaining candidates of that kind.
    virtual AutoDetectOutcome autoDetectBestConnection(const std::string& ip,
                                                       const std::string& username,
                                                       const std::string& password,
                                                       const std::string& vendorHint);

    virtual HealthCheckResult checkHealth(const std::string& url, ConnectionKind kind,
                                          const std::string& username = {},
                                          const std::string& password = {});

    void setImageDecoder(ImageDecoder decoder) { decoder_ = std::move(decoder); }
    void setPause(std::chrono::milliseconds pause) { options_.pause = pause; }

    const ConnectionOptions& options() const { return options_; }
    const ProfileCatalog& catalog() const { return catalog_; }

protected:
    ConnectionTester(const ProfileCatalog& catalog, ConnectionOptions options);

    const ProfileCatalog& catalog_;
    std::shared_ptr<HttpClient> http_;
    MediaSourceFactory sources_;
    ConnectionOptions options_;
    ImageDecoder decoder_;
};

} // namespace cw
