#include "exec/position_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

using core::Action;
using core::Side;

namespace exec {

PositionTracker::PositionTracker(double cash, double fee_rate)
    : cash_(cash), fee_(fee_rate), peak_(cash) {}

double PositionTracker::net_qty() const {
    double q = 0.0;
    for (std::size_t i=0;i<book_.size();++i) q += (i % 2 ? -book_[i].base_qty : book_[i].base_qty);
    return q;
}

double PositionTracker::equity(double price) const {
    return cash_ + net_qty()*price;
}

Fill PositionTracker::apply(const core::TradeIntent& t, double price){
    Fill f{t, 0.0, price, 0.0};
    if (!(price > 0.0)) {
        spdlog::warn("paper fill skipped: bad price {}", price);
        return f;
    }
    auto& p = book_[slot(t.mode, t.side)];
    const bool is_long = t.side == Side::Long;

    if (t.action == Action::Open) {
        const double eq = equity(price);
        if (eq <= 0.0) { spdlog::warn("paper fill skipped: equity {:.2f}", eq); return f; }
        const double qty = std::abs(t.size_fraction) * eq / price;
        const double fee = qty*price*fee_;
        // new avg entry: (old_qty*old_px + qty*px) / (old_qty + qty)
        p.avg_entry = (p.base_qty*p.avg_entry + qty*price) / (p.base_qty + qty);
        p.base_qty += qty;
        cash_ += (is_long ? -qty*price : qty*price) - fee;
        fees_ += fee;
        f.qty = qty;
        return f;
    }

    if (p.base_qty <= 0.0) return f;
    const double qty = p.base_qty;
    const double fee = qty*price*fee_;
    const double gross = is_long ? qty*(price - p.avg_entry) : qty*(p.avg_entry - price);
    cash_ += (is_long ? qty*price : -qty*price) - fee;
    fees_ += fee;
    f.qty = qty;
    f.realized = gross - fee;
    realized_ += gross;
    ++trips_;
    if (gross > 0.0) ++wins_;
    p = NetPos{};
    return f;
}

void PositionTracker::mark(double price){
    const double eq = equity(price);
    peak_ = std::max(peak_, eq);
    if (peak_ > 0.0) maxdd_ = std::max(maxdd_, (peak_ - eq) / peak_);
}

} // namespace exec
