// HealthMonitor.cpp: batched periodic health sweep with automatic reconnection
#include "cw/HealthMonitor.hpp"
#include "cw/Log.hpp"
#include "cw/WorkerPool.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace cw {

namespace {

// Host part of scheme://[user[:pass]@]host[:port]/...
std::string hostFromUrl(const std::string& url) {
    auto scheme = url.find("://");
    std::size_t start = scheme == std::string::npos ? 0 : scheme + 3;
    std::size_t end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);
    auto colon = authority.find(':');
    if (colon != std::string::npos)
        authority = authority.substr(0, colon);
    return authority;
}

} // namespace

HealthMonitor::HealthMonitor(std::shared_ptr<DeviceStore> store, std::shared_ptr<ConnectionTester> tester,
                             HealthOptions options, EventBus* events, ReconnectionScheduler::NowFn now)
    : store_(std::move(store)), tester_(std::move(tester)), options_(options), events_(events),
      scheduler_(options.reconnect, std::move(now)) {
    if (options_.batchSize == 0)
        options_.batchSize = 1;
}

HealthMonitor::~HealthMonitor() {
    stop();
}

bool HealthMonitor::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        log(LogLevel::Warn, "Health monitor already running");
        return false;
    }
    log(LogLevel::Info, "Starting health monitor (interval %llds, batch %zu)",
        static_cast<long long>(options_.interval.count()), options_.batchSize);
    thread_ = std::thread(&HealthMonitor::run, this);
    return true;
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (!running_.exchange(false) && !thread_.joinable())
            return;
    }
    waitCv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    log(LogLevel::Info, "Health monitor stopped");
}

bool HealthMonitor::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(waitMutex_);
    waitCv_.wait_for(lock, duration, [this] { return !running_.load(); });
    return running_.load();
}

void HealthMonitor::run() {
    while (running_.load()) {
        try {
            sweepOnce();
        } catch (const std::exception& e) {
            log(LogLevel::Error, "Health check loop error: %s", e.what());
        }
        if (!waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(options_.interval)))
            break;
    }
}

void HealthMonitor::sweepOnce() {
    std::lock_guard<std::mutex> sweepLock(sweepMutex_);
    if (!store_ || !tester_) {
        log(LogLevel::Error, "Health monitor has no device store or connection tester");
        return;
    }

    std::vector<ManagedDevice> devices = store_->listActiveDevices();
    {
        // Forget devices that are no longer active
        std::lock_guard<std::mutex> lock(tableMutex_);
        for (auto it = table_.begin(); it != table_.end();) {
            bool present = std::any_of(devices.begin(), devices.end(),
                                       [&](const ManagedDevice& d) { return d.id == it->first; });
            if (!present) {
                scheduler_.forget(it->first);
                it = table_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (devices.empty()) {
        std::lock_guard<std::mutex> lock(tableMutex_);
        lastSweep_ = std::chrono::system_clock::now();
        return;
    }

    log(LogLevel::Info, "Checking health of %zu camera(s)", devices.size());
    {
        WorkerPool pool(std::min(options_.batchSize, devices.size()));
        for (std::size_t i = 0; i < devices.size(); i += options_.batchSize) {
            if (i > 0) {
                // Pause between batches; a stopped loop abandons the sweep
                if (running_.load()) {
                    if (!waitFor(options_.batchPause))
                        break;
                } else if (options_.batchPause.count() > 0) {
                    std::this_thread::sleep_for(options_.batchPause);
                }
            }
            const std::size_t end = std::min(i + options_.batchSize, devices.size());
            for (std::size_t j = i; j < end; ++j) {
                const ManagedDevice& device = devices[j];
                pool.submit([this, &device] {
                    try {
                        checkDevice(device);
                    } catch (const std::exception& e) {
                        log(LogLevel::Error, "Error checking camera %lld: %s",
                            static_cast<long long>(device.id), e.what());
                    }
                });
            }
            pool.wait();
        }
    }

    std::lock_guard<std::mutex> lock(tableMutex_);
    lastSweep_ = std::chrono::system_clock::now();
}

void HealthMonitor::checkDevice(const ManagedDevice& device) {
    CameraHealthStatus previous;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto it = table_.find(device.id);
        if (it != table_.end()) {
            previous = it->second.status;
            known = true;
        }
    }

    CameraHealthStatus status = previous;
    status.deviceId = device.id;
    status.name = device.name;
    status.url = device.url;
    status.kind = device.kind;
    status.lastCheck = std::chrono::system_clock::now();

    HealthCheckResult result;
    if (device.url.empty()) {
        result.online = false;
        result.tier = HealthTier::Offline;
        result.error = "No stream URL configured";
        result.errorKind = ErrorKind::ProtocolMismatch;
        log(LogLevel::Warn, "Camera %lld has no stream URL", static_cast<long long>(device.id));
    } else {
        result = tester_->checkHealth(device.url, device.kind, device.credentials.username,
                                      device.credentials.password);
    }

    bool sample = result.online;
    if (result.online) {
        status.online = true;
        status.tier = result.tier;
        status.responseTimeMs = result.responseTimeMs;
        status.failedAttempts = 0;
        status.lastError.reset();
        status.errorKind = ErrorKind::None;
        status.retriesExhausted = false;
        scheduler_.recordAttempt(device.id, true);
        log(LogLevel::Debug, "Camera %lld (%s): %s (%.0fms)", static_cast<long long>(device.id),
            device.name.c_str(), toString(status.tier), status.responseTimeMs);
    } else {
        status.online = false;
        status.tier = HealthTier::Offline;
        status.responseTimeMs = 0.0;
        status.failedAttempts += 1;
        status.lastError = result.error.value_or("Unknown error");
        status.errorKind = result.errorKind;
        log(LogLevel::Warn, "Camera %lld (%s): offline - %s", static_cast<long long>(device.id),
            device.name.c_str(), status.lastError->c_str());

        if (scheduler_.shouldRetry(device.id)) {
            status.retriesExhausted = false;
            if (attemptReconnection(device, status)) {
                scheduler_.recordAttempt(device.id, true);
            } else {
                scheduler_.recordAttempt(device.id, false);
            }
        } else if (scheduler_.attempts(device.id) >= scheduler_.policy().maxAttempts) {
            if (!status.retriesExhausted)
                log(LogLevel::Warn, "Camera %lld: automatic reconnection exhausted after %d attempts",
                    static_cast<long long>(device.id), scheduler_.policy().maxAttempts);
            status.retriesExhausted = true;
            status.errorKind = ErrorKind::ExhaustedRetries;
        }
    }

    DeviceStatusUpdate update;
    update.online = status.online;
    if (status.online)
        update.lastSeen = status.lastCheck;
    update.health = status.tier;
    update.failureCount = status.failedAttempts;
    update.lastError = status.lastError;
    if (!store_->updateDeviceStatus(device.id, update))
        log(LogLevel::Warn, "Could not persist status of camera %lld", static_cast<long long>(device.id));

    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto it = table_.try_emplace(device.id, options_.uptimeSamples).first;
        it->second.uptime.record(sample);
        status.uptimePercentage = it->second.uptime.percentage();
        it->second.status = status;
    }

    if (!known || previous.online != status.online || previous.tier != status.tier ||
        previous.retriesExhausted != status.retriesExhausted)
        publishStatus(status);
}

bool HealthMonitor::attemptReconnection(const ManagedDevice& device, CameraHealthStatus& status) {
    std::string ip = device.ip.empty() ? hostFromUrl(device.url) : device.ip;
    if (ip.empty()) {
        log(LogLevel::Debug, "Camera %lld has no address to re-detect", static_cast<long long>(device.id));
        return false;
    }
    log(LogLevel::Info, "Attempting reconnection for camera %lld at %s", static_cast<long long>(device.id),
        ip.c_str());

    AutoDetectOutcome outcome = tester_->autoDetectBestConnection(
        ip, device.credentials.username, device.credentials.password, device.vendorHint);
    if (!outcome.best || !outcome.best->success) {
        log(LogLevel::Warn, "Reconnection failed for camera %lld", static_cast<long long>(device.id));
        return false;
    }
    const ConnectionTestResult& best = *outcome.best;
    if (best.kind == ConnectionKind::Snapshot) {
        log(LogLevel::Warn, "Camera %lld only answers snapshots at %s; not treated as reconnected",
            static_cast<long long>(device.id), best.url.c_str());
        return false;
    }

    if (!store_->updateDeviceConnection(device.id, best.url, best.kind))
        log(LogLevel::Warn, "Could not persist new connection for camera %lld", static_cast<long long>(device.id));

    status.url = best.url;
    status.kind = best.kind;
    status.online = true;
    status.tier = healthTierFor(true, best.responseTimeMs);
    status.responseTimeMs = best.responseTimeMs;
    status.failedAttempts = 0;
    status.lastError.reset();
    status.errorKind = ErrorKind::None;
    status.retriesExhausted = false;
    log(LogLevel::Info, "Camera %lld reconnected via %s", static_cast<long long>(device.id), best.url.c_str());
    return true;
}

void HealthMonitor::publishStatus(const CameraHealthStatus& status) {
    if (!events_)
        return;
    nlohmann::json evt = {
        {"event", kCameraStatusChannel},
        {"camera_id", status.deviceId},
        {"name", status.name},
        {"online", status.online},
        {"health", toString(status.tier)},
        {"failed_attempts", status.failedAttempts},
        {"retries_exhausted", status.retriesExhausted},
    };
    if (status.lastError)
        evt["error"] = *status.lastError;
    events_->publish(kCameraStatusChannel, evt.dump());
}

std::optional<CameraHealthStatus> HealthMonitor::requestRecheck(DeviceId id) {
    if (!store_ || !tester_)
        return std::nullopt;
    auto devices = store_->listActiveDevices();
    auto it = std::find_if(devices.begin(), devices.end(), [id](const ManagedDevice& d) { return d.id == id; });
    if (it == devices.end()) {
        log(LogLevel::Warn, "Re-check requested for unknown or inactive camera %lld", static_cast<long long>(id));
        return std::nullopt;
    }
    log(LogLevel::Info, "Manual re-check of camera %lld", static_cast<long long>(id));
    std::lock_guard<std::mutex> sweepLock(sweepMutex_);
    scheduler_.reset(id);
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto entry = table_.find(id);
        if (entry != table_.end())
            entry->second.status.retriesExhausted = false;
    }
    checkDevice(*it);
    return getCameraHealth(id);
}

int HealthMonitor::secondsUntilNextCheck(const CameraHealthStatus& status) const {
    if (!status.lastCheck)
        return 0;
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now() - *status.lastCheck).count();
    return static_cast<int>(std::max<long long>(0, options_.interval.count() - elapsed));
}

std::optional<CameraHealthStatus> HealthMonitor::getCameraHealth(DeviceId id) const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = table_.find(id);
    if (it == table_.end())
        return std::nullopt;
    CameraHealthStatus copy = it->second.status;
    copy.nextCheckInSeconds = secondsUntilNextCheck(copy);
    return copy;
}

std::vector<CameraHealthStatus> HealthMonitor::getAllHealthStatus() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    std::vector<CameraHealthStatus> out;
    out.reserve(table_.size());
    for (const auto& [id, entry] : table_) {
        CameraHealthStatus copy = entry.status;
        copy.nextCheckInSeconds = secondsUntilNextCheck(copy);
        out.push_back(std::move(copy));
    }
    return out;
}

SystemHealthSummary HealthMonitor::getSystemHealthSummary() const {
    SystemHealthSummary summary;
    summary.running = running_.load();
    std::lock_guard<std::mutex> lock(tableMutex_);
    summary.lastSweep = lastSweep_;
    double uptimeTotal = 0.0;
    for (const auto& [id, entry] : table_) {
        const auto& s = entry.status;
        ++summary.total;
        if (s.online)
            ++summary.online;
        else
            ++summary.offline;
        if (s.retriesExhausted)
            ++summary.retriesExhausted;
        ++summary.byTier[s.tier];
        uptimeTotal += entry.uptime.percentage();
    }
    if (summary.total > 0)
        summary.averageUptime = uptimeTotal / static_cast<double>(summary.total);
    return summary;
}

ReconnectionStatus HealthMonitor::getReconnectionStatus(DeviceId id) const {
    return scheduler_.getStatus(id);
}

} // namespace cw
