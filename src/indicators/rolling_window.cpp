#include "indicators/rolling_window.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace ind {

void RollingWindow::push(double x){
    v_.push_back(x);
    while (v_.size() > cap_) v_.pop_front();
}

// Sums are recomputed on demand: a running sum drifts, and a flat series has
// to come back as exactly zero variance.
double RollingWindow::sum() const {
    return std::accumulate(v_.begin(), v_.end(), 0.0);
}

double RollingWindow::mean() const {
    return v_.empty() ? 0.0 : sum() / static_cast<double>(v_.size());
}

double RollingWindow::mean_sq() const {
    if (v_.empty()) return 0.0;
    double s = 0.0;
    for (double x : v_) s += x*x;
    return s / static_cast<double>(v_.size());
}

double RollingWindow::sample_stddev() const {
    if (v_.size() < 2) return 0.0;
    const double m = mean();
    double var = 0.0;
    for (double x : v_) { const double d = x - m; var += d*d; }
    var /= static_cast<double>(v_.size() - 1);
    return std::sqrt(std::max(0.0, var));
}

} // namespace ind
