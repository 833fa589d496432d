#pragma once

#include <cstddef>
#include <vector>

namespace cw {

// Fixed-size ring of pass/fail samples with a running success count
class UptimeRing {
public:
    explicit UptimeRing(std::size_t capacity = 43200);

    void record(bool success);
    void clear();

    std::size_t size() const { return count_; }
    std::size_t capacity() const { return samples_.size(); }
    std::size_t successes() const { return successes_; }

    // 0.0 when there are no samples
    double percentage() const;

private:
    std::vector<bool> samples_;
    std::size_t head_ = 0;
    std::size_t count_ = 0;
    std::size_t successes_ = 0;
};

} // namespace cw
