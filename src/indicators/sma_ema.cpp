#include "indicators/sma_ema.hpp"

namespace ind {

Ema::Ema(std::size_t length)
    : length_(length ? length : 1), k_(2.0/(static_cast<double>(length_)+1.0)) {}

void Ema::update(double x){
    ++count_;
    if (count_ < length_) { seed_sum_ += x; return; }
    if (count_ == length_) {
        seed_sum_ += x;
        value_ = seed_sum_ / static_cast<double>(length_);
        return;
    }
    value_ += k_ * (x - value_);
}

} // namespace ind
