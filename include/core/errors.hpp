#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace core {

// Rejected parameter set; thrown before any bar is processed.
class ConfigError : public std::invalid_argument {
public:
    ConfigError(const std::string& field, const std::string& reason)
        : std::invalid_argument(field + ": " + reason), field_(field) {}

    const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

// Bar timestamp not strictly after the previous one. Engine state is left untouched.
class OutOfOrderBar : public std::runtime_error {
public:
    OutOfOrderBar(std::int64_t last_ms, std::int64_t got_ms)
        : std::runtime_error("bar timestamp " + std::to_string(got_ms)
                             + " not after " + std::to_string(last_ms)),
          last_ms_(last_ms), got_ms_(got_ms) {}

    std::int64_t last_ms() const noexcept { return last_ms_; }
    std::int64_t got_ms() const noexcept { return got_ms_; }

private:
    std::int64_t last_ms_;
    std::int64_t got_ms_;
};

} // namespace core
