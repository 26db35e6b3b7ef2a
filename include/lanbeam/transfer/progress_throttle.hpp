#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace lanbeam::transfer {

// Rate-limits per-file progress notifications. A value passes when it is
// higher than the last one emitted and either the interval has elapsed or
// it is 100. The first value always passes.
class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressThrottle(std::chrono::milliseconds interval);

    std::optional<std::uint32_t> update(std::uint32_t percentage, Clock::time_point now = Clock::now());

    // Starts a new file.
    void reset();

    std::optional<std::uint32_t> last_emitted() const { return last_value_; }

private:
    std::chrono::milliseconds interval_;
    std::optional<std::uint32_t> last_value_;
    Clock::time_point last_emit_;
};

}
