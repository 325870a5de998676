#include "indicators/trend_quality.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

TqParams TqParams::from(const core::StrategyConfig& c){
    TqParams p;
    p.fast_length = static_cast<std::size_t>(c.fast_length);
    p.slow_length = static_cast<std::size_t>(c.slow_length);
    p.trend_length = static_cast<std::size_t>(c.trend_length);
    p.noise_length = static_cast<std::size_t>(c.noise_length);
    p.correction_factor = c.correction_factor;
    p.noise_type = c.noise_type;
    return p;
}

TrendQuality::TrendQuality(const TqParams& p)
    : p_(p),
      smf_(2.0/(1.0 + static_cast<double>(p.trend_length))),
      fast_(p.fast_length),
      slow_(p.slow_length),
      diffs_(p.noise_length) {}

std::size_t TrendQuality::warmup_bars() const {
    return std::max(p_.fast_length, p_.slow_length) + p_.noise_length - 1;
}

void TrendQuality::reset(){
    fast_.reset(); slow_.reset(); diffs_.clear();
    cpc_ = trend_ = noise_ = 0.0;
    last_sign_ = 0;
    prev_close_.reset();
    value_.reset();
}

std::optional<double> TrendQuality::update(double close){
    fast_.update(close);
    slow_.update(close);

    if (!(fast_.ready() && slow_.ready())) {
        prev_close_ = close;
        value_.reset();
        return value_;
    }

    // ties count as bearish
    const int sign = fast_.value() > slow_.value() ? 1 : -1;
    if (last_sign_ == 0 || sign != last_sign_ || !prev_close_) cpc_ = 0.0;
    else cpc_ += close - *prev_close_;
    last_sign_ = sign;
    prev_close_ = close;

    trend_ = trend_*(1.0 - smf_) + cpc_*smf_;
    diffs_.push(std::abs(cpc_ - trend_));

    if (!diffs_.full()) {
        value_.reset();
        return value_;
    }

    noise_ = p_.noise_type == core::NoiseType::Squared
        ? p_.correction_factor * std::sqrt(diffs_.mean_sq())
        : p_.correction_factor * diffs_.mean();

    if (noise_ > kNoiseEpsilon) value_ = trend_ / noise_;
    else value_.reset();
    return value_;
}

} // namespace ind
