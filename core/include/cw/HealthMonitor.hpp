#pragma once

#include "cw/ConnectionTester.hpp"
#include "cw/DeviceStore.hpp"
#include "cw/EventBus.hpp"
#include "cw/ReconnectionScheduler.hpp"
#include "cw/UptimeRing.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cw {

struct HealthOptions {
    std::chrono::seconds interval{60};
    std::size_t batchSize = 10;
    std::chrono::milliseconds batchPause{1000};
    std::size_t uptimeSamples = 43200;
    ReconnectPolicy reconnect;
};

struct CameraHealthStatus {
    DeviceId deviceId = 0;
    std::string name;
    std::string url;
    ConnectionKind kind = ConnectionKind::Stream;
    bool online = false;
    HealthTier tier = HealthTier::Unknown;
    std::optional<std::chrono::system_clock::time_point> lastCheck;
    double responseTimeMs = 0.0;
    double uptimePercentage = 0.0;
    int failedAttempts = 0; // consecutive failed checks
    std::optional<std::string> lastError;
    ErrorKind errorKind = ErrorKind::None;
    int nextCheckInSeconds = 0;
    bool retriesExhausted = false;
};

struct SystemHealthSummary {
    std::size_t total = 0;
    std::size_t online = 0;
    std::size_t offline = 0;
    std::size_t retriesExhausted = 0;
    std::map<HealthTier, std::size_t> byTier;
    double averageUptime = 0.0;
    std::optional<std::chrono::system_clock::time_point> lastSweep;
    bool running = false;
};

// Periodically verifies every active device and repairs lost connections
class HealthMonitor {
public:
    HealthMonitor(std::shared_ptr<DeviceStore> store, std::shared_ptr<ConnectionTester> tester,
                  HealthOptions options = {}, EventBus* events = nullptr,
                  ReconnectionScheduler::NowFn now = nullptr);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Owns the periodic loop; the first sweep runs immediately
    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // One full pass over the active devices in batches
    void sweepOnce();

    // Clears the device's backoff state and checks it right away
    std::optional<CameraHealthStatus> requestRecheck(DeviceId id);

    std::optional<CameraHealthStatus> getCameraHealth(DeviceId id) const;
    std::vector<CameraHealthStatus> getAllHealthStatus() const;
    SystemHealthSummary getSystemHealthSummary() const;
    ReconnectionStatus getReconnectionStatus(DeviceId id) const;

    const HealthOptions& options() const { return options_; }

private:
    struct Entry {
        CameraHealthStatus status;
        UptimeRing uptime;
        explicit Entry(std::size_t samples) : uptime(samples) {}
    };

    void run();
    void checkDevice(const ManagedDevice& device);
    bool attemptReconnection(const ManagedDevice& device, CameraHealthStatus& status);
    void publishStatus(const CameraHealthStatus& status);
    bool waitFor(std::chrono::milliseconds duration);
    int secondsUntilNextCheck(const CameraHealthStatus& status) const;

    std::shared_ptr<DeviceStore> store_;
    std::shared_ptr<ConnectionTester> tester_;
    HealthOptions options_;
    EventBus* events_;
    ReconnectionScheduler scheduler_;

    mutable std::mutex tableMutex_;
    std::map<DeviceId, Entry> table_;
    std::optional<std::chrono::system_clock::time_point> lastSweep_;

    std::mutex sweepMutex_; // one sweep at a time
    std::atomic<bool> running_{false};
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::thread thread_;
};

} // namespace cw
