// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/core/progress.hpp>
#include <algorithm>
#include <cmath>

namespace roomdl::core {

std::uint32_t compute_percent(std::uint64_t downloaded,
                              std::optional<std::uint64_t> total,
                              bool complete) noexcept {
    if (complete) {
        return 100;
    }
    if (total && *total > 0) {
        double ratio = static_cast<double>(downloaded) / static_cast<double>(*total) * 100.0;
        return static_cast<std::uint32_t>(std::min(99.0, std::round(ratio)));
    }
    double mib = static_cast<double>(downloaded) / (1024.0 * 1024.0);
    return static_cast<std::uint32_t>(std::min(95.0, std::floor(5.0 + 2.0 * mib)));
}

//=============================================================================
// ProgressMeter
//=============================================================================

ProgressMeter::ProgressMeter(std::chrono::milliseconds interval, Clock::time_point start) noexcept
    : interval_(interval)
    , start_(start)
    , last_emit_(start) {}

std::optional<ProgressSample> ProgressMeter::update(std::uint64_t downloaded, Clock::time_point now) noexcept {
    high_water_ = std::max(high_water_, downloaded);
    if (now - last_emit_ < interval_) {
        return std::nullopt;
    }
    return make_sample(high_water_, now, false);
}

ProgressSample ProgressMeter::finish(std::uint64_t downloaded, Clock::time_point now) noexcept {
    high_water_ = std::max(high_water_, downloaded);
    total_ = high_water_;
    return make_sample(high_water_, now, true);
}

ProgressSample ProgressMeter::make_sample(std::uint64_t downloaded, Clock::time_point now, bool done) noexcept {
    using namespace std::chrono;

    ProgressSample sample;
    sample.downloaded = downloaded;
    sample.total = total_;
    sample.percent = compute_percent(downloaded, total_, done);
    sample.elapsed = duration_cast<milliseconds>(now - start_);
    sample.done = done;

    double window = duration<double>(now - last_emit_).count();
    if (window > 0.0) {
        sample.speed_bps = static_cast<double>(downloaded - last_bytes_) / window;
    }
    double since_start = duration<double>(now - start_).count();
    if (since_start > 0.0) {
        sample.average_bps = static_cast<double>(downloaded) / since_start;
    }

    last_emit_ = now;
    last_bytes_ = downloaded;
    return sample;
}

} // namespace roomdl::core
