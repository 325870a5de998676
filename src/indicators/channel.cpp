#include "indicators/channel.hpp"

namespace ind {

Channel Channel::from(const core::StrategyConfig& c){
    const auto p = static_cast<std::size_t>(c.period);
    if (c.channel_variant == core::ChannelVariant::LinearRegression)
        return Channel(RegressionChannel(p, c.upper_deviation, c.lower_deviation));
    return Channel(BollingerChannel(p, c.upper_deviation, c.lower_deviation));
}

std::optional<Bands> Channel::update(double close){
    return std::visit([close](auto& ch){ return ch.update(close); }, impl_);
}

std::optional<Bands> Channel::value() const {
    return std::visit([](const auto& ch){ return ch.value(); }, impl_);
}

void Channel::reset(){
    std::visit([](auto& ch){ ch.reset(); }, impl_);
}

std::string Channel::id() const {
    return std::visit([](const auto& ch){ return ch.id(); }, impl_);
}

std::size_t Channel::warmup_bars() const {
    return std::visit([](const auto& ch){ return ch.warmup_bars(); }, impl_);
}

core::ChannelVariant Channel::variant() const {
    return std::holds_alternative<RegressionChannel>(impl_)
        ? core::ChannelVariant::LinearRegression
        : core::ChannelVariant::Bollinger;
}

double Channel::stddev() const {
    return std::visit([](const auto& ch){ return ch.stddev(); }, impl_);
}

} // namespace ind
