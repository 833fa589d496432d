// fakes.hpp: in-process stand-ins for network, media and discovery collaborators
#pragma once

#include "cw/ConnectionTester.hpp"
#include "cw/HostProber.hpp"
#include "cw/HttpClient.hpp"
#include "cw/MediaSource.hpp"
#include "cw/OnvifProbe.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace cw::test {

class FakeHostProber : public HostProber {
public:
    std::map<std::string, std::set<std::uint16_t>> open;
    std::map<std::string, std::string> names;
    std::map<std::string, std::string> macs;
    std::atomic<int> probes{0};

    bool isPortOpen(const std::string& ip, std::uint16_t port, std::chrono::milliseconds) override {
        ++probes;
        auto it = open.find(ip);
        return it != open.end() && it->second.count(port) > 0;
    }
    std::optional<std::string> reverseName(const std::string& ip) override {
        auto it = names.find(ip);
        if (it == names.end())
            return std::nullopt;
        return it->second;
    }
    std::optional<std::string> hardwareAddress(const std::string& ip) override {
        auto it = macs.find(ip);
        if (it == macs.end())
            return std::nullopt;
        return it->second;
    }
};

// Answers by exact URL; anything else is unreachable
class FakeHttpClient : public HttpClient {
public:
    std::map<std::string, HttpResponse> responses;
    std::vector<HttpRequest> requests;
    std::mutex mutex;

    static HttpResponse reply(int status, std::string contentType, std::string body) {
        HttpResponse r;
        r.status = status;
        r.contentType = std::move(contentType);
        r.body = std::move(body);
        if (status == 401 || status == 403) {
            r.errorKind = ErrorKind::AuthenticationRequired;
            r.error = "HTTP " + std::to_string(status);
        } else if (status >= 400) {
            r.errorKind = ErrorKind::ProtocolMismatch;
            r.error = "HTTP " + std::to_string(status);
        }
        return r;
    }

    HttpResponse fetch(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(request);
        auto it = responses.find(request.url);
        if (it != responses.end())
            return it->second;
        HttpResponse r;
        r.errorKind = ErrorKind::Unreachable;
        r.error = "Connection refused";
        return r;
    }
};

// Shared bookkeeping across every FakeMediaSource one factory creates
struct MediaScript {
    std::set<std::string> openable;       // URLs that open; empty means all
    std::set<std::string> authRequired;   // URLs that fail with 401
    int width = 64;
    int height = 48;
    int framesPerOpen = -1;               // -1 means unlimited
    std::chrono::milliseconds frameInterval{5};
    bool hangOnOpen = false;              // open blocks until its timeout or the stop flag


    std::atomic<int> opens{0};
    std::atomic<int> live{0};             // sources currently open
    std::atomic<int> maxLive{0};
    std::atomic<int> hanging{0};          // opens currently blocked
    std::mutex mutex;
    std::vector<std::string> openedUrls;
};

class FakeMediaSource : public MediaSource {
public:
    explicit FakeMediaSource(std::shared_ptr<MediaScript> script) : script_(std::move(script)) {}
    ~FakeMediaSource() override { close(); }

    bool open(const std::string& url, std::chrono::milliseconds timeout) override {
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            script_->openedUrls.push_back(url);
        }
        if (script_->hangOnOpen) {
            ++script_->hanging;
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline && !(stop_ && stop_->load()))
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            --script_->hanging;
            error_ = stop_ && stop_->load() ? "Open interrupted" : "Open timed out";
            errorKind_ = ErrorKind::Unreachable;
            return false;
        }
        if (script_->authRequired.count(url)) {
            error_ = "401 Unauthorized";
            errorKind_ = ErrorKind::AuthenticationRequired;
            return false;
        }
        if (!script_->openable.empty() && !script_->openable.count(url)) {
            error_ = "Connection refused";
            errorKind_ = ErrorKind::Unreachable;
            return false;
        }
        ++script_->opens;
        int now = ++script_->live;
        int seen = script_->maxLive.load();
        while (now > seen && !script_->maxLive.compare_exchange_weak(seen, now)) {
        }
        open_ = true;
        produced_ = 0;
        return true;
    }

    bool read(Frame& frame) override {
        if (!open_)
            return false;
        if (script_->framesPerOpen >= 0 && produced_ >= script_->framesPerOpen) {
            error_ = "End of stream";
            errorKind_ = ErrorKind::ProtocolMismatch;
            return false;
        }
        std::this_thread::sleep_for(script_->frameInterval);
        frame.width = script_->width;
        frame.height = script_->height;
        frame.data.assign(Frame::bufferSize(frame.width, frame.height),
                          static_cast<std::uint8_t>(produced_ & 0xff));
        ++produced_;
        return true;
    }

    void close() override {
        if (open_) {
            open_ = false;
            --script_->live;
        }
    }

    MediaProperties properties() const override {
        MediaProperties p;
        p.resolution = Resolution{script_->width, script_->height};
        p.fps = 25.0;
        p.codec = std::string("h264");
        return p;
    }
    void setStopFlag(const std::atomic<bool>* stop) override { stop_ = stop; }
    ErrorKind lastErrorKind() const override { return errorKind_; }
    std::string lastError() const override { return error_; }

private:
    std::shared_ptr<MediaScript> script_;
    const std::atomic<bool>* stop_ = nullptr;
    bool open_ = false;
    int produced_ = 0;
    ErrorKind errorKind_ = ErrorKind::None;
    std::string error_;
};

inline MediaSourceFactory fakeMediaFactory(std::shared_ptr<MediaScript> script) {
    return [script] { return std::unique_ptr<MediaSource>(new FakeMediaSource(script)); };
}

// Replays queued datagrams; sleeps through the wait when none are left
class FakeDiscoveryTransport : public DiscoveryTransport {
public:
    explicit FakeDiscoveryTransport(std::deque<Datagram> replies, std::vector<std::string>* sent = nullptr)
        : replies_(std::move(replies)), sent_(sent) {}

    bool send(const std::string& payload) override {
        if (sent_)
            sent_->push_back(payload);
        return true;
    }

    std::optional<Datagram> receive(std::chrono::milliseconds wait) override {
        if (replies_.empty()) {
            std::this_thread::sleep_for(wait);
            return std::nullopt;
        }
        Datagram d = std::move(replies_.front());
        replies_.pop_front();
        return d;
    }

private:
    std::deque<Datagram> replies_;
    std::vector<std::string>* sent_;
};

// Connection tester whose answers are scripted per call
class ScriptedConnectionTester : public ConnectionTester {
public:
    explicit ScriptedConnectionTester(const ProfileCatalog& catalog)
        : ConnectionTester(catalog, ConnectionOptions{}) {}

    std::deque<HealthCheckResult> healthResults; // consumed front first; empty means offline
    std::function<AutoDetectOutcome(const std::string& ip)> detect;
    std::atomic<int> healthCalls{0};
    std::atomic<int> detectCalls{0};
    std::mutex mutex;
    std::string lastVendor;

    HealthCheckResult checkHealth(const std::string&, ConnectionKind, const std::string&,
                                  const std::string&) override {
        ++healthCalls;
        std::lock_guard<std::mutex> lock(mutex);
        if (healthResults.empty()) {
            HealthCheckResult r;
            r.error = "Connection refused";
            r.errorKind = ErrorKind::Unreachable;
            return r;
        }
        HealthCheckResult r = healthResults.front();
        healthResults.pop_front();
        return r;
    }

    AutoDetectOutcome autoDetectBestConnection(const std::string& ip, const std::string&,
                                               const std::string&, const std::string& vendor) override {
        ++detectCalls;
        {
            std::lock_guard<std::mutex> lock(mutex);
            lastVendor = vendor;
        }
        if (detect)
            return detect(ip);
        return {};
    }

    static HealthCheckResult online(double latencyMs) {
        HealthCheckResult r;
        r.online = true;
        r.responseTimeMs = latencyMs;
        r.tier = healthTierFor(true, latencyMs);
        return r;
    }
    static HealthCheckResult offline(const std::string& error = "Connection refused") {
        HealthCheckResult r;
        r.error = error;
        r.errorKind = ErrorKind::Unreachable;
        return r;
    }
};

} // namespace cw::test
