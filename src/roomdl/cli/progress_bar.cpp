// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/cli/progress_bar.hpp>
#include <roomdl/core/units.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace roomdl::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

ProgressBar::ProgressBar(std::string_view label, std::ostream* out)
    : out_(out ? *out : std::cout)
    , label_(label) {}

void ProgressBar::update(const core::ProgressSample& sample) {
    if (finished_) return;

    last_ = sample;
    // Redraw on every sample, they are already throttled upstream
    auto line = render(sample);
    std::size_t pad = width_ > line.size() ? width_ - line.size() : 0;
    width_ = std::max(width_, line.size());
    out_ << '\r' << line << std::string(pad, ' ') << std::flush;
    drawn_ = true;
}

void ProgressBar::finish() {
    if (finished_) return;
    if (!last_.done) {
        last_.done = true;
        last_.percent = 100;
        last_.total = last_.downloaded;
    }
    update(last_);
    finished_ = true;
    out_ << std::endl;
}

void ProgressBar::clear() {
    if (!drawn_) return;
    out_ << '\r' << std::string(width_, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render(const core::ProgressSample& sample) const {
    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    const double percent = std::clamp(static_cast<double>(sample.percent), 0.0, 100.0);
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        line += '>';
        line.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    line += ']';

    std::string pct = std::to_string(sample.percent) + "%";
    line += ' ';
    line.append(pct.size() < 4 ? 4 - pct.size() : 0, ' ');
    line += pct;

    line += " (";
    line += core::format_bytes(sample.downloaded);
    if (sample.total) {
        line += "/";
        line += core::format_bytes(*sample.total);
    }
    line += ")";

    double speed = sample.done ? sample.average_bps : sample.speed_bps;
    if (speed > 0.0) {
        line += " @ ";
        line += core::format_speed(static_cast<std::uint64_t>(speed));
    }

    if (!sample.done && sample.total && *sample.total > sample.downloaded && sample.speed_bps > 0.0) {
        auto eta = static_cast<std::uint64_t>(static_cast<double>(*sample.total - sample.downloaded) / sample.speed_bps);
        line += " ETA ";
        line += core::format_duration(eta);
    } else if (sample.done) {
        line += " in ";
        line += core::format_duration(static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(sample.elapsed).count()));
    }
    return line;
}

} // namespace roomdl::cli
