#pragma once
#include <array>
#include <cstddef>
#include "core/types.hpp"

namespace exec {

struct NetPos {
    double base_qty{0.0};   // always >= 0; direction comes from the bucket
    double avg_entry{0.0};  // qty-weighted entry price
};

struct Fill {
    core::TradeIntent intent;
    double qty{0.0};
    double price{0.0};
    double realized{0.0}; // CLOSE only, after fees
};

// Paper book for the backtest host: turns intents into share quantities per
// (mode, side) bucket, settles cash and tracks equity/drawdown. Fills happen at
// the price handed in, with a proportional fee on notional.
class PositionTracker {
public:
    explicit PositionTracker(double cash, double fee_rate = 0.0);

    Fill apply(const core::TradeIntent& t, double price);
    void mark(double price); // equity peak / drawdown at a new close

    NetPos get(core::Mode m, core::Side s) const { return book_[slot(m, s)]; }
    double net_qty() const; // long minus short
    double cash() const { return cash_; }
    double equity(double price) const;
    double max_drawdown() const { return maxdd_; }
    double realized_pnl() const { return realized_; }
    double fees_paid() const { return fees_; }
    int round_trips() const { return trips_; }
    int wins() const { return wins_; }

private:
    static std::size_t slot(core::Mode m, core::Side s) {
        return (m == core::Mode::Breakout ? 2u : 0u) + (s == core::Side::Short ? 1u : 0u);
    }

    std::array<NetPos, 4> book_{};
    double cash_;
    double fee_;
    double peak_{0.0};
    double maxdd_{0.0};
    double realized_{0.0};
    double fees_{0.0};
    int trips_{0};
    int wins_{0};
};

} // namespace exec
