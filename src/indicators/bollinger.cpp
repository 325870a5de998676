#include "indicators/bollinger.hpp"

namespace ind {

Bands compute_bb(const RollingWindow& w, double k_upper, double k_lower){
    const double mid = w.mean();
    const double sd  = w.sample_stddev();
    return {mid + k_upper*sd, mid, mid - k_lower*sd};
}

std::optional<Bands> BollingerChannel::update(double close){
    closes.push(close);
    if (!closes.full()) { last_.reset(); return last_; }
    last_ = compute_bb(closes, k_up_, k_lo_);
    return last_;
}

} // namespace ind
