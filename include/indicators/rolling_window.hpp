#pragma once
#include <cstddef>
#include <deque>
#include "core/types.hpp"

namespace ind {

// Last N values, oldest first. Pushing into a full window drops the oldest.
class RollingWindow {
    std::deque<double> v_; std::size_t cap_;
public:
    explicit RollingWindow(std::size_t capacity): cap_(capacity ? capacity : 1) {}

    void push(double x);
    void push(const core::Bar& b) { push(b.close); }
    void clear() { v_.clear(); }

    std::size_t size() const { return v_.size(); }
    std::size_t capacity() const { return cap_; }
    bool full() const { return v_.size() == cap_; }
    bool empty() const { return v_.empty(); }

    double operator[](std::size_t i) const { return v_[i]; }
    double back() const { return v_.back(); }
    const std::deque<double>& values() const { return v_; }

    double sum() const;
    double mean() const;
    double mean_sq() const;
    // N-1 denominator; 0 for fewer than two values
    double sample_stddev() const;
};

} // namespace ind
