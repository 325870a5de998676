#pragma once
#include "core/types.hpp"

namespace strategy {

// Pyramided entries currently open, per (mode, side) bucket. A bucket is open
// while its counter is non-zero.
struct PositionState {
    int reversion_long{0};
    int reversion_short{0};
    int breakout_long{0};
    int breakout_short{0};

    int& count(core::Mode m, core::Side s) {
        if (m == core::Mode::Reversion) return s == core::Side::Long ? reversion_long : reversion_short;
        return s == core::Side::Long ? breakout_long : breakout_short;
    }
    int count(core::Mode m, core::Side s) const {
        if (m == core::Mode::Reversion) return s == core::Side::Long ? reversion_long : reversion_short;
        return s == core::Side::Long ? breakout_long : breakout_short;
    }

    bool any_breakout() const { return breakout_long > 0 || breakout_short > 0; }
    bool any_reversion() const { return reversion_long > 0 || reversion_short > 0; }
    bool flat() const { return !any_breakout() && !any_reversion(); }
};

inline bool operator==(const PositionState& a, const PositionState& b) {
    return a.reversion_long == b.reversion_long && a.reversion_short == b.reversion_short
        && a.breakout_long == b.breakout_long && a.breakout_short == b.breakout_short;
}
inline bool operator!=(const PositionState& a, const PositionState& b) { return !(a == b); }

} // namespace strategy
