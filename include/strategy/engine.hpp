#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include "core/config.hpp"
#include "core/types.hpp"
#include "indicators/bands.hpp"
#include "indicators/channel.hpp"
#include "indicators/trend_quality.hpp"
#include "strategy/decision.hpp"
#include "strategy/position_state.hpp"

namespace strategy {

// Per-instrument pipeline: TQ -> channel -> decide(). Owns all of its state;
// run one Engine per instrument.
class Engine {
public:
    // Throws core::ConfigError.
    explicit Engine(const core::StrategyConfig& cfg);

    // Throws core::OutOfOrderBar (state untouched) if the timestamp does not
    // advance.
    core::Intents on_bar(const core::Bar& b);

    const core::StrategyConfig& config() const { return cfg_; }
    const PositionState& state() const { return state_; }
    std::optional<double> last_tq() const { return tq_.value(); }
    std::optional<ind::Bands> last_bands() const { return channel_.value(); }
    const ind::TrendQuality& trend_quality() const { return tq_; }
    const ind::Channel& channel() const { return channel_; }

    std::size_t bars_seen() const { return bars_; }
    std::size_t warmup_bars() const;
    bool warmed_up() const { return bars_ >= warmup_bars(); }

private:
    core::StrategyConfig cfg_;
    DecisionParams params_;
    ind::TrendQuality tq_;
    ind::Channel channel_;
    PositionState state_{};
    std::optional<std::int64_t> last_ts_;
    std::size_t bars_{0};
};

} // namespace strategy
