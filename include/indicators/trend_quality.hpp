#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "core/config.hpp"
#include "indicators/rolling_window.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

struct TqParams {
    std::size_t fast_length{7};
    std::size_t slow_length{15};
    std::size_t trend_length{4};
    std::size_t noise_length{250};
    double correction_factor{2.0};
    core::NoiseType noise_type{core::NoiseType::Linear};

    static TqParams from(const core::StrategyConfig& cfg);
};

// Trend-Quality: smoothed cumulative price change since the last fast/slow
// EMA crossover, divided by the average deviation of that change from its
// smoothed value.
//
//   > 0  clean uptrend     < 0  clean downtrend     ~0  range
//
// update() returns nullopt while warming up and whenever the noise term is
// effectively zero (flat prices); the previous value is not carried over.
class TrendQuality {
public:
    static constexpr double kNoiseEpsilon = 1e-12;

    explicit TrendQuality(const TqParams& p);

    std::optional<double> update(double close);
    void reset();

    std::string id() const { return "TQ"; }
    std::size_t warmup_bars() const;

    std::optional<double> value() const { return value_; }
    double cpc() const { return cpc_; }
    double trend() const { return trend_; }
    double noise() const { return noise_; }
    int ema_sign() const { return last_sign_; }
    const Ema& fast() const { return fast_; }
    const Ema& slow() const { return slow_; }

private:
    TqParams p_;
    double smf_;
    Ema fast_;
    Ema slow_;
    RollingWindow diffs_;

    double cpc_{0.0};
    double trend_{0.0};
    double noise_{0.0};
    int last_sign_{0};             // 0 = no crossover state yet
    std::optional<double> prev_close_;
    std::optional<double> value_;
};

} // namespace ind
