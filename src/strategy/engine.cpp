#include "strategy/engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <string>

namespace strategy {

// validate() runs before any member that sizes a buffer from the config
static const core::StrategyConfig& checked(const core::StrategyConfig& cfg){
    core::validate(cfg);
    return cfg;
}

Engine::Engine(const core::StrategyConfig& cfg)
    : cfg_(checked(cfg)),
      params_(DecisionParams::from(cfg_)),
      tq_(ind::TqParams::from(cfg_)),
      channel_(ind::Channel::from(cfg_)) {
    spdlog::debug("engine: {} channel, warmup {} bars", channel_.id(), warmup_bars());
}

std::size_t Engine::warmup_bars() const {
    return std::max(tq_.warmup_bars(), channel_.warmup_bars());
}

core::Intents Engine::on_bar(const core::Bar& b){
    if (last_ts_ && b.timestamp_ms <= *last_ts_)
        throw core::OutOfOrderBar(*last_ts_, b.timestamp_ms);
    last_ts_ = b.timestamp_ms;
    ++bars_;

    Reading r;
    r.close = b.close;
    r.tq = tq_.update(b.close);
    r.bands = channel_.update(b.close);

    auto d = decide(state_, r, params_);
    state_ = d.state;

    for (const auto& t : d.intents)
        spdlog::debug("bar {} close={:.4f} tq={} -> {}", b.timestamp_ms, b.close,
                      r.tq ? fmt::format("{:.3f}", *r.tq) : std::string("n/a"),
                      core::describe(t));
    return std::move(d.intents);
}

} // namespace strategy
