#include "data/consolidator.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace data {

Consolidator::Consolidator(int minutes)
    : bucket_ms_(static_cast<std::int64_t>(minutes) * 60'000) {
    if (minutes <= 0) throw std::invalid_argument("consolidation minutes must be > 0");
}

std::int64_t Consolidator::bucket_start(std::int64_t ts) const {
    std::int64_t q = ts / bucket_ms_;
    if (ts % bucket_ms_ < 0) --q; // floor for pre-epoch stamps
    return q * bucket_ms_;
}

std::optional<core::Bar> Consolidator::push(const core::Bar& b){
    const std::int64_t start = bucket_start(b.timestamp_ms);
    std::optional<core::Bar> done;

    if (cur_ && start < cur_->timestamp_ms) {
        ++dropped_;
        spdlog::warn("consolidator: bar {} belongs to an already closed bucket ({} < {}), dropped",
                     b.timestamp_ms, start, cur_->timestamp_ms);
        return done;
    }
    if (cur_ && start != cur_->timestamp_ms) {
        done = cur_;
        cur_.reset();
    }
    if (!cur_) {
        cur_ = b;
        cur_->timestamp_ms = start;
        return done;
    }
    cur_->high = std::max(cur_->high, b.high);
    cur_->low = std::min(cur_->low, b.low);
    cur_->close = b.close;
    cur_->volume += b.volume;
    return done;
}

std::optional<core::Bar> Consolidator::flush(){
    auto out = cur_;
    cur_.reset();
    return out;
}

} // namespace data
