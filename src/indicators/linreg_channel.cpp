#include "indicators/linreg_channel.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

LinFit fit_line(const RollingWindow& w){
    LinFit f;
    const std::size_t n = w.size();
    if (n == 0) return f;
    if (n == 1) { f.intercept = w[0]; return f; }

    const double nd = static_cast<double>(n);
    const double sum_x  = nd*(nd-1.0)/2.0;
    const double sum_x2 = (nd-1.0)*nd*(2.0*nd-1.0)/6.0;
    double sum_y = 0.0, sum_xy = 0.0;
    for (std::size_t i=0;i<n;++i){ sum_y += w[i]; sum_xy += static_cast<double>(i)*w[i]; }

    // n >= 2 keeps the denominator positive
    const double den = nd*sum_x2 - sum_x*sum_x;
    f.slope = (nd*sum_xy - sum_x*sum_y) / den;
    f.intercept = (sum_y - f.slope*sum_x) / nd;

    double mean_r = 0.0;
    for (std::size_t i=0;i<n;++i) mean_r += w[i] - f.at(static_cast<double>(i));
    mean_r /= nd;
    double var = 0.0;
    for (std::size_t i=0;i<n;++i){
        const double d = (w[i] - f.at(static_cast<double>(i))) - mean_r;
        var += d*d;
    }
    f.residual_sd = std::sqrt(std::max(0.0, var/(nd-1.0)));
    return f;
}

std::optional<Bands> RegressionChannel::update(double close){
    closes.push(close);
    if (!closes.full()) { last_.reset(); return last_; }
    fit_ = fit_line(closes);
    const double mid = fit_.at(static_cast<double>(closes.size() - 1));
    last_ = Bands{mid + up_dev_*fit_.residual_sd, mid, mid - lo_dev_*fit_.residual_sd};
    return last_;
}

} // namespace ind
