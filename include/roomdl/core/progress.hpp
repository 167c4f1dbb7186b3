// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace roomdl::core {

// One throttled observation of a running transfer
struct ProgressSample {
    std::uint64_t downloaded{0};
    std::optional<std::uint64_t> total;
    std::uint32_t percent{0};
    double speed_bps{0.0};       // Over the last interval
    double average_bps{0.0};     // Since start
    std::chrono::milliseconds elapsed{0};
    bool done{false};
};

using ProgressFn = std::function<void(const ProgressSample&)>;

// Streaming: min(99, round(downloaded / total * 100)). Unknown total: min(95, 5 + 2 per MiB).
// 100 is reserved for a confirmed completion.
[[nodiscard]] std::uint32_t compute_percent(std::uint64_t downloaded,
                                            std::optional<std::uint64_t> total,
                                            bool complete) noexcept;

// Turns a stream of byte counts into at most one sample per interval.
// Time points are passed in so the meter can be driven deterministically.
class ProgressMeter {
public:
    using Clock = std::chrono::steady_clock;

    ProgressMeter(std::chrono::milliseconds interval, Clock::time_point start) noexcept;

    void set_total(std::optional<std::uint64_t> total) noexcept { total_ = total; }
    [[nodiscard]] std::optional<std::uint64_t> total() const noexcept { return total_; }

    // Record the byte count, returns a sample when the interval has elapsed
    [[nodiscard]] std::optional<ProgressSample> update(std::uint64_t downloaded, Clock::time_point now) noexcept;

    // Final 100% sample, total is pinned to the byte count
    [[nodiscard]] ProgressSample finish(std::uint64_t downloaded, Clock::time_point now) noexcept;

private:
    [[nodiscard]] ProgressSample make_sample(std::uint64_t downloaded, Clock::time_point now, bool done) noexcept;

    std::chrono::milliseconds interval_;
    Clock::time_point start_;
    Clock::time_point last_emit_;
    std::uint64_t last_bytes_{0};
    std::uint64_t high_water_{0};
    std::optional<std::uint64_t> total_;
};

} // namespace roomdl::core
