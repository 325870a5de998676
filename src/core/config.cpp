#include "core/config.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <fstream>
#include <type_traits>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace core {

const char* to_string(ChannelVariant v) {
    switch (v) {
        case ChannelVariant::Bollinger: return "bollinger";
        default:                        return "linear_regression";
    }
}

const char* to_string(NoiseType t) {
    switch (t) {
        case NoiseType::Linear: return "linear";
        default:                return "squared";
    }
}

static ChannelVariant parse_variant(const std::string& s) {
    if (s == "bollinger") return ChannelVariant::Bollinger;
    if (s == "linear_regression" || s == "linreg") return ChannelVariant::LinearRegression;
    throw ConfigError("channel_variant", "unknown variant '" + s + "'");
}

static NoiseType parse_noise(const std::string& s) {
    if (s == "linear") return NoiseType::Linear;
    if (s == "squared") return NoiseType::Squared;
    throw ConfigError("noise_type", "unknown noise type '" + s + "'");
}

void validate(const StrategyConfig& c) {
    if (c.period <= 1) throw ConfigError("period", "must be > 1");
    if (!(c.upper_deviation > 0.0)) throw ConfigError("upper_deviation", "must be > 0");
    if (!(c.lower_deviation > 0.0)) throw ConfigError("lower_deviation", "must be > 0");
    if (c.fast_length <= 0) throw ConfigError("fast_length", "must be > 0");
    if (c.slow_length <= 0) throw ConfigError("slow_length", "must be > 0");
    if (c.trend_length <= 0) throw ConfigError("trend_length", "must be > 0");
    if (c.noise_length <= 0) throw ConfigError("noise_length", "must be > 0");
    if (!(c.correction_factor > 0.0)) throw ConfigError("correction_factor", "must be > 0");
    if (!(c.low_threshold < c.high_threshold))
        throw ConfigError("low_threshold", "must be below high_threshold");
    if (!(c.between_factor >= 0.0)) throw ConfigError("between_factor", "must be >= 0");
    if (c.max_orders < 1) throw ConfigError("max_orders", "must be >= 1");
    if (!(c.position_fraction > 0.0 && c.position_fraction <= 1.0))
        throw ConfigError("position_fraction", "must be in (0, 1]");

    // legal, but the crossover then reads inverted
    if (c.fast_length >= c.slow_length)
        spdlog::warn("fast_length {} is not below slow_length {}", c.fast_length, c.slow_length);
}

int warmup_bars(const StrategyConfig& c) {
    const int tq = std::max(c.fast_length, c.slow_length) + c.noise_length - 1;
    return std::max(tq, c.period);
}

// nlohmann converts floats and booleans into arithmetic targets; refuse that
template <typename T>
static void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) throw ConfigError(key, "expected a boolean");
    } else if constexpr (std::is_integral_v<T>) {
        if (!it->is_number_integer()) throw ConfigError(key, "expected an integer");
    } else if constexpr (std::is_floating_point_v<T>) {
        if (!it->is_number()) throw ConfigError(key, "expected a number");
    } else {
        if (!it->is_string()) throw ConfigError(key, "expected a string");
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(key, e.what());
    }
}

StrategyConfig config_from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("<root>", "expected a JSON object");

    StrategyConfig c;
    read_key(j, "period", c.period);
    read_key(j, "upper_deviation", c.upper_deviation);
    read_key(j, "lower_deviation", c.lower_deviation);
    read_key(j, "fast_length", c.fast_length);
    read_key(j, "slow_length", c.slow_length);
    read_key(j, "trend_length", c.trend_length);
    read_key(j, "noise_length", c.noise_length);
    read_key(j, "correction_factor", c.correction_factor);
    read_key(j, "high_threshold", c.high_threshold);
    read_key(j, "low_threshold", c.low_threshold);
    read_key(j, "between_factor", c.between_factor);
    read_key(j, "max_orders", c.max_orders);
    read_key(j, "position_fraction", c.position_fraction);
    read_key(j, "enable_reversion_long", c.enable_reversion_long);
    read_key(j, "enable_reversion_short", c.enable_reversion_short);
    read_key(j, "enable_breakout_long", c.enable_breakout_long);
    read_key(j, "enable_breakout_short", c.enable_breakout_short);

    std::string s;
    if (j.contains("channel_variant")) {
        read_key(j, "channel_variant", s);
        c.channel_variant = parse_variant(s);
    }
    if (j.contains("noise_type")) {
        read_key(j, "noise_type", s);
        c.noise_type = parse_noise(s);
    }
    return c;
}

json to_json(const StrategyConfig& c) {
    return json{
        {"period", c.period},
        {"upper_deviation", c.upper_deviation},
        {"lower_deviation", c.lower_deviation},
        {"channel_variant", to_string(c.channel_variant)},
        {"fast_length", c.fast_length},
        {"slow_length", c.slow_length},
        {"trend_length", c.trend_length},
        {"noise_length", c.noise_length},
        {"correction_factor", c.correction_factor},
        {"noise_type", to_string(c.noise_type)},
        {"high_threshold", c.high_threshold},
        {"low_threshold", c.low_threshold},
        {"between_factor", c.between_factor},
        {"max_orders", c.max_orders},
        {"position_fraction", c.position_fraction},
        {"enable_reversion_long", c.enable_reversion_long},
        {"enable_reversion_short", c.enable_reversion_short},
        {"enable_breakout_long", c.enable_breakout_long},
        {"enable_breakout_short", c.enable_breakout_short},
    };
}

StrategyConfig load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw ConfigError("<file>", "cannot open " + path);

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError("<file>", std::string("parse error in ") + path + ": " + e.what());
    }
    auto cfg = config_from_json(j);
    validate(cfg);
    spdlog::info("config {} loaded: channel={} period={} noise_length={}",
                 path, to_string(cfg.channel_variant), cfg.period, cfg.noise_length);
    return cfg;
}

} // namespace core
