#include "cw/ReconnectionScheduler.hpp"

#include <algorithm>
#include <cmath>

namespace cw {

ReconnectionScheduler::ReconnectionScheduler(ReconnectPolicy policy, NowFn now)
    : policy_(policy), now_(std::move(now)) {
    if (!now_)
        now_ = [] { return std::chrono::system_clock::now(); };
}

double ReconnectionScheduler::delaySeconds(int attempts) const {
    if (attempts < 0)
        attempts = 0;
    double delay = policy_.initialDelaySeconds * std::pow(policy_.backoffFactor, attempts);
    if (!std::isfinite(delay))
        return policy_.maxDelaySeconds;
    return std::min(delay, policy_.maxDelaySeconds);
}

double ReconnectionScheduler::currentDelaySeconds(DeviceId id) const {
    return delaySeconds(attempts(id));
}

bool ReconnectionScheduler::shouldRetry(DeviceId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(id);
    if (it == states_.end())
        return true;
    const State& s = it->second;
    if (s.attempts >= policy_.maxAttempts)
        return false;
    if (s.lastAttempt) {
        double elapsed = std::chrono::duration<double>(now_() - *s.lastAttempt).count();
        if (elapsed < delaySeconds(s.attempts))
            return false;
    }
    return true;
}

void ReconnectionScheduler::recordAttempt(DeviceId id, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    State& s = states_[id];
    if (success) {
        s.attempts = 0;
        s.lastAttempt.reset();
    } else {
        ++s.attempts;
        s.lastAttempt = now_();
    }
}

void ReconnectionScheduler::reset(DeviceId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(id);
    if (it != states_.end()) {
        it->second.attempts = 0;
        it->second.lastAttempt.reset();
    }
}

void ReconnectionScheduler::forget(DeviceId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(id);
}

int ReconnectionScheduler::attempts(DeviceId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(id);
    return it == states_.end() ? 0 : it->second.attempts;
}

ReconnectionStatus ReconnectionScheduler::getStatus(DeviceId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ReconnectionStatus status;
    status.deviceId = id;
    status.maxAttempts = policy_.maxAttempts;
    auto it = states_.find(id);
    if (it == states_.end())
        return status;
    const State& s = it->second;
    status.attempts = s.attempts;
    status.lastAttempt = s.lastAttempt;
    status.exhausted = s.attempts >= policy_.maxAttempts;
    if (s.lastAttempt) {
        double elapsed = std::chrono::duration<double>(now_() - *s.lastAttempt).count();
        status.nextRetryInSeconds = std::max(0.0, delaySeconds(s.attempts) - elapsed);
    }
    return status;
}

} // namespace cw
