#pragma once

#include "cw/Types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace cw {

struct ReconnectPolicy {
    int maxAttempts = 5;
    double initialDelaySeconds = 10.0;
    double backoffFactor = 2.0;
    double maxDelaySeconds = 300.0;
};

struct ReconnectionStatus {
    DeviceId deviceId = 0;
    int attempts = 0;
    int maxAttempts = 0;
    std::optional<std::chrono::system_clock::time_point> lastAttempt;
    double nextRetryInSeconds = 0.0;
    bool exhausted = false;
};

// Per-device attempt bookkeeping with capped exponential backoff; performs no I/O
class ReconnectionScheduler {
public:
    using NowFn = std::function<std::chrono::system_clock::time_point()>;

    explicit ReconnectionScheduler(ReconnectPolicy policy = {}, NowFn now = nullptr);

    // min(initial * factor^attempts, max)
    double delaySeconds(int attempts) const;
    double currentDelaySeconds(DeviceId id) const;

    bool shouldRetry(DeviceId id) const;
    void recordAttempt(DeviceId id, bool success);
    void reset(DeviceId id);
    void forget(DeviceId id);

    int attempts(DeviceId id) const;
    ReconnectionStatus getStatus(DeviceId id) const;

    const ReconnectPolicy& policy() const { return policy_; }

private:
    struct State {
        int attempts = 0;
        std::optional<std::chrono::system_clock::time_point> lastAttempt;
    };

    ReconnectPolicy policy_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::map<DeviceId, State> states_;
};

} // namespace cw
