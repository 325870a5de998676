#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include "core/config.hpp"
#include "indicators/bands.hpp"
#include "indicators/bollinger.hpp"
#include "indicators/linreg_channel.hpp"

namespace ind {

// One of the two channel variants, picked from the config. Callers only see
// update() -> bands.
class Channel {
public:
    using Impl = std::variant<BollingerChannel, RegressionChannel>;

    explicit Channel(Impl impl): impl_(std::move(impl)) {}

    static Channel from(const core::StrategyConfig& cfg);

    std::optional<Bands> update(double close);
    std::optional<Bands> value() const;
    void reset();

    std::string id() const;
    std::size_t warmup_bars() const;
    core::ChannelVariant variant() const;

    // band half-width unit: price stddev or residual stddev
    double stddev() const;

    const Impl& impl() const { return impl_; }

private:
    Impl impl_;
};

} // namespace ind
