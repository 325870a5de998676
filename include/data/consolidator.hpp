#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include "core/types.hpp"

namespace data {

// Rolls fine bars up into fixed, epoch-aligned time buckets (e.g. 1m -> 5m).
// A bucket is emitted when the first bar of a later bucket arrives.
class Consolidator {
public:
    explicit Consolidator(int minutes);

    // Returns the finished bucket, if `b` opened a new one. A bar older than
    // the open bucket is dropped with a warning and counted in dropped().
    std::optional<core::Bar> push(const core::Bar& b);

    // Emits the partial bucket, if any.
    std::optional<core::Bar> flush();

    std::int64_t bucket_ms() const { return bucket_ms_; }
    std::size_t dropped() const { return dropped_; }

private:
    std::int64_t bucket_start(std::int64_t ts) const;

    std::int64_t bucket_ms_;
    std::optional<core::Bar> cur_;
    std::size_t dropped_{0};
};

} // namespace data
