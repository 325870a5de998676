#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "indicators/bands.hpp"
#include "indicators/rolling_window.hpp"

namespace ind {

// mean +/- k * sample stddev over the last `period` closes
Bands compute_bb(const RollingWindow& w, double k_upper, double k_lower);

class BollingerChannel {
    RollingWindow closes; double k_up_, k_lo_;
    std::optional<Bands> last_;
public:
    BollingerChannel(std::size_t p=20, double k_upper=2.0, double k_lower=2.0)
        : closes(p), k_up_(k_upper), k_lo_(k_lower) {}

    std::string id() const { return "BOLL"; }
    std::size_t warmup_bars() const { return closes.capacity(); }
    void reset() { closes.clear(); last_.reset(); }

    std::optional<Bands> update(double close);
    std::optional<Bands> value() const { return last_; }
    double stddev() const { return closes.sample_stddev(); }
};

} // namespace ind
