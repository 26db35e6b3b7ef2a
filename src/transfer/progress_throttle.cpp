#include "lanbeam/transfer/progress_throttle.hpp"
#include <algorithm>

namespace lanbeam::transfer {

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval)
    : interval_(interval)
    , last_value_(std::nullopt)
    , last_emit_() {
}

std::optional<std::uint32_t> ProgressThrottle::update(std::uint32_t percentage, Clock::time_point now) {
    percentage = std::min<std::uint32_t>(percentage, 100);

    if (last_value_) {
        if (percentage <= *last_value_) {
            return std::nullopt;
        }
        if (percentage != 100 && now - last_emit_ < interval_) {
            return std::nullopt;
        }
    }

    last_value_ = percentage;
    last_emit_ = now;
    return percentage;
}

void ProgressThrottle::reset() {
    last_value_.reset();
    last_emit_ = Clock::time_point();
}

}
