#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "indicators/bands.hpp"
#include "indicators/rolling_window.hpp"

namespace ind {

struct LinFit {
    double slope{0.0};
    double intercept{0.0};
    double residual_sd{0.0};  // sample stddev of close - fit
    double at(double x) const { return slope*x + intercept; }
};

// Least squares over x = 0..n-1, oldest close at x = 0.
LinFit fit_line(const RollingWindow& w);

// Regression line evaluated at the newest bar, with bands at independent
// multiples of the residual stddev above and below it.
class RegressionChannel {
    RollingWindow closes; double up_dev_, lo_dev_;
    LinFit fit_{};
    std::optional<Bands> last_;
public:
    RegressionChannel(std::size_t p=20, double upper_dev=2.0, double lower_dev=2.0)
        : closes(p), up_dev_(upper_dev), lo_dev_(lower_dev) {}

    std::string id() const { return "LINREG"; }
    std::size_t warmup_bars() const { return closes.capacity(); }
    void reset() { closes.clear(); fit_ = {}; last_.reset(); }

    std::optional<Bands> update(double close);
    std::optional<Bands> value() const { return last_; }

    double slope() const { return fit_.slope; }
    double intercept() const { return fit_.intercept; }
    double stddev() const { return fit_.residual_sd; }
};

} // namespace ind
