#pragma once
#include <optional>
#include "core/config.hpp"
#include "core/types.hpp"
#include "indicators/bands.hpp"
#include "strategy/position_state.hpp"

namespace strategy {

// Indicator outputs for one bar; nullopt = not ready.
struct Reading {
    double close{0.0};
    std::optional<double> tq;
    std::optional<ind::Bands> bands;
};

struct DecisionParams {
    double high_threshold{2.5};
    double low_threshold{-4.0};
    double between_factor{0.0005};
    int max_orders{3};
    double position_fraction{0.5};
    bool enable_reversion_long{true};
    bool enable_reversion_short{true};
    bool enable_breakout_long{true};
    bool enable_breakout_short{true};

    static DecisionParams from(const core::StrategyConfig& cfg);
};

struct Decision {
    PositionState state;
    core::Intents intents;
};

// One bar of the entry/exit state machine. Exits are evaluated before entries
// so a bar never closes what it just opened:
//
//   1. reversion short out: close back under upper, or TQ extreme / not ready
//   2. reversion long out:  close back over lower, or TQ extreme / not ready
//   3. breakout long out:   close back under upper and TQ inside thresholds
//   4. breakout short out:  close back over lower and TQ inside thresholds
//   5. reversion short in:  close > upper, TQ < high
//   6. reversion long in:   close < lower, TQ > low
//   7. breakout long in:    close > upper, TQ > high (flattens everything else first)
//   8. breakout short in:   close < lower, TQ < low  (same)
//
// Entries need a TQ reading; reversion entries are also held back while a
// breakout position is open. Nothing happens until the bands are ready.
Decision decide(const PositionState& st, const Reading& r, const DecisionParams& p);

} // namespace strategy
