#include "strategy/decision.hpp"
#include <utility>

using core::Action;
using core::Mode;
using core::Side;
using core::TradeIntent;

namespace strategy {

DecisionParams DecisionParams::from(const core::StrategyConfig& c){
    DecisionParams p;
    p.high_threshold = c.high_threshold;
    p.low_threshold = c.low_threshold;
    p.between_factor = c.between_factor;
    p.max_orders = c.max_orders;
    p.position_fraction = c.position_fraction;
    p.enable_reversion_long = c.enable_reversion_long;
    p.enable_reversion_short = c.enable_reversion_short;
    p.enable_breakout_long = c.enable_breakout_long;
    p.enable_breakout_short = c.enable_breakout_short;
    return p;
}

namespace {

struct Step {
    PositionState st;
    core::Intents out;
    const DecisionParams& p;
    PositionState closed{}; // buckets flattened on this bar

    void flatten(Mode m, Side s){
        int& n = st.count(m, s);
        if (n == 0) return;
        out.push_back(TradeIntent{Action::Close, s, m, 1.0, n});
        n = 0;
        closed.count(m, s) = 1;
    }

    void add(Mode m, Side s){
        int& n = st.count(m, s);
        if (n >= p.max_orders || closed.count(m, s)) return;
        const double f = s == Side::Long ? p.position_fraction : -p.position_fraction;
        out.push_back(TradeIntent{Action::Open, s, m, f, 1});
        ++n;
    }
};

} // namespace

Decision decide(const PositionState& st, const Reading& r, const DecisionParams& p){
    Step k{st, {}, p};
    if (!r.bands) return {k.st, std::move(k.out)};

    const double close = r.close;
    const double upper = r.bands->upper;
    const double lower = r.bands->lower;
    const double slack = close * p.between_factor;

    const bool ready = r.tq.has_value();
    const double tq = ready ? *r.tq : 0.0;
    // a missing TQ reading counts as extreme for reversion exits
    const bool extreme = !ready || tq >= p.high_threshold || tq <= p.low_threshold;
    const bool inside  = ready && tq > p.low_threshold && tq < p.high_threshold;

    // --- exits
    if (k.st.reversion_short > 0 && (close < upper - slack || extreme))
        k.flatten(Mode::Reversion, Side::Short);
    if (k.st.reversion_long > 0 && (close > lower + slack || extreme))
        k.flatten(Mode::Reversion, Side::Long);
    if (k.st.breakout_long > 0 && close < upper - slack && inside)
        k.flatten(Mode::Breakout, Side::Long);
    if (k.st.breakout_short > 0 && close > lower + slack && inside)
        k.flatten(Mode::Breakout, Side::Short);

    if (!ready) return {k.st, std::move(k.out)};

    // --- entries
    if (p.enable_reversion_short && close > upper && tq < p.high_threshold && !k.st.any_breakout())
        k.add(Mode::Reversion, Side::Short);

    if (p.enable_reversion_long && close < lower && tq > p.low_threshold && !k.st.any_breakout())
        k.add(Mode::Reversion, Side::Long);

    if (p.enable_breakout_long && close > upper && tq > p.high_threshold) {
        k.flatten(Mode::Breakout, Side::Short);
        k.flatten(Mode::Reversion, Side::Short);
        k.flatten(Mode::Reversion, Side::Long);
        k.add(Mode::Breakout, Side::Long);
    }

    if (p.enable_breakout_short && close < lower && tq < p.low_threshold) {
        k.flatten(Mode::Breakout, Side::Long);
        k.flatten(Mode::Reversion, Side::Long);
        k.flatten(Mode::Reversion, Side::Short);
        k.add(Mode::Breakout, Side::Short);
    }

    return {k.st, std::move(k.out)};
}

} // namespace strategy
