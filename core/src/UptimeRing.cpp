#include "cw/UptimeRing.hpp"

namespace cw {

UptimeRing::UptimeRing(std::size_t capacity)
    : samples_(capacity == 0 ? 1 : capacity, false) {}

void UptimeRing::record(bool success) {
    if (count_ == samples_.size()) {
        // Overwrite the oldest sample
        if (samples_[head_])
            --successes_;
    } else {
        ++count_;
    }
    samples_[head_] = success;
    if (success)
        ++successes_;
    head_ = (head_ + 1) % samples_.size();
}

void UptimeRing::clear() {
    head_ = 0;
    count_ = 0;
    successes_ = 0;
}

double UptimeRing::percentage() const {
    if (count_ == 0)
        return 0.0;
    return 100.0 * static_cast<double>(successes_) / static_cast<double>(count_);
}

} // namespace cw
