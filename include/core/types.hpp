#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace core {

// OHLCV bar
struct Bar {
    std::int64_t timestamp_ms{}; // bar open time (ms since epoch)
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

enum class Side { Long, Short };
enum class Mode { Reversion, Breakout };
enum class Action { Open, Close };

// What the engine asks the host to do. The host turns size_fraction into a
// concrete quantity; the engine never sees prices of fills.
struct TradeIntent {
    Action action{Action::Open};
    Side side{Side::Long};
    Mode mode{Mode::Reversion};
    double size_fraction{0.0}; // OPEN: signed fraction of capital; CLOSE: 1.0 = whole bucket
    int orders{1};             // CLOSE: pyramided entries being flattened
};

using Intents = std::vector<TradeIntent>;

inline const char* to_string(Side s) {
    switch (s) {
        case Side::Long:  return "LONG";
        default:          return "SHORT";
    }
}

inline const char* to_string(Mode m) {
    switch (m) {
        case Mode::Reversion: return "REVERSION";
        default:              return "BREAKOUT";
    }
}

inline const char* to_string(Action a) {
    switch (a) {
        case Action::Open: return "OPEN";
        default:           return "CLOSE";
    }
}

std::string describe(const TradeIntent& t);

inline bool operator==(const TradeIntent& a, const TradeIntent& b) {
    return a.action == b.action && a.side == b.side && a.mode == b.mode
        && a.size_fraction == b.size_fraction && a.orders == b.orders;
}

} // namespace core
