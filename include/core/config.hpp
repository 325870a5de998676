#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace core {

enum class ChannelVariant { Bollinger, LinearRegression };
enum class NoiseType { Linear, Squared };

const char* to_string(ChannelVariant v);
const char* to_string(NoiseType t);

// Full parameter set of one strategy instance. Defaults follow the 5-minute
// QQQ setup the strategy was tuned on.
struct StrategyConfig {
    // channel
    int period{20};
    double upper_deviation{2.0};
    double lower_deviation{2.0};
    ChannelVariant channel_variant{ChannelVariant::Bollinger};

    // trend quality
    int fast_length{7};
    int slow_length{15};
    int trend_length{4};
    int noise_length{250};
    double correction_factor{2.0};
    NoiseType noise_type{NoiseType::Linear};

    // regime / exits
    double high_threshold{2.5};
    double low_threshold{-4.0};
    double between_factor{0.0005};

    // sizing
    int max_orders{3};
    double position_fraction{0.5};

    // setup switches
    bool enable_reversion_long{true};
    bool enable_reversion_short{true};
    bool enable_breakout_long{true};
    bool enable_breakout_short{true};
};

// Throws ConfigError naming the first offending field.
void validate(const StrategyConfig& cfg);

// Bars needed before both indicators can report.
int warmup_bars(const StrategyConfig& cfg);

StrategyConfig config_from_json(const nlohmann::json& j);
nlohmann::json to_json(const StrategyConfig& cfg);

// Reads and validates a JSON config file.
StrategyConfig load_config(const std::string& path);

} // namespace core
