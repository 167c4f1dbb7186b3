// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/core/progress.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace roomdl::cli {

// Single-line terminal progress bar fed by transfer samples
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {}, std::ostream* out = nullptr);

    void update(const core::ProgressSample& sample);

    // Draw the final state and end the line
    void finish();

    // Clear the progress bar line
    void clear();

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    // Formatted line without the carriage return, exposed for tests
    [[nodiscard]] std::string render(const core::ProgressSample& sample) const;

private:
    std::ostream& out_;
    std::string label_;
    core::ProgressSample last_{};
    bool drawn_{false};
    bool finished_{false};
    std::size_t width_{0};
};

} // namespace roomdl::cli
