#pragma once
#include <cstddef>

namespace ind {

// Exponential moving average, seeded with the simple average of the first
// `length` inputs. value() is meaningful once ready().
class Ema {
    std::size_t length_; double k_;
    std::size_t count_{0}; double seed_sum_{0.0}; double value_{0.0};
public:
    explicit Ema(std::size_t length);

    void update(double x);
    void reset() { count_ = 0; seed_sum_ = 0.0; value_ = 0.0; }

    bool ready() const { return count_ >= length_; }
    double value() const { return value_; }
    std::size_t length() const { return length_; }
    std::size_t samples() const { return count_; }
};

} // namespace ind
