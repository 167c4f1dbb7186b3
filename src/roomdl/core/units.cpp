// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/core/units.hpp>
#include <spdlog/fmt/fmt.h>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>

namespace roomdl::core {

namespace {

constexpr std::array<const char*, 5> BYTE_UNITS = {"B", "KiB", "MiB", "GiB", "TiB"};

int unit_power(std::string_view unit) noexcept {
    if (unit.empty()) return 0;

    // Accept "K", "KB", "KiB", "k" ... case-insensitive
    const char lead = static_cast<char>(std::toupper(static_cast<unsigned char>(unit.front())));
    auto rest = unit.substr(1);
    if (!rest.empty() && (rest.front() == 'i' || rest.front() == 'I')) rest.remove_prefix(1);
    if (!rest.empty() && (rest.front() == 'b' || rest.front() == 'B')) rest.remove_prefix(1);
    if (!rest.empty()) return -1;

    switch (lead) {
        case 'B': return unit.size() == 1 ? 0 : -1;
        case 'K': return 1;
        case 'M': return 2;
        case 'G': return 3;
        case 'T': return 4;
        default:  return -1;
    }
}

} // namespace

std::optional<std::uint64_t> parse_size(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    if (text.empty()) return std::nullopt;

    // Split numeric part from unit
    std::size_t num_end = 0;
    while (num_end < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[num_end])) || text[num_end] == '.' || text[num_end] == ',')) {
        ++num_end;
    }
    if (num_end == 0) return std::nullopt;

    std::string number;
    for (std::size_t i = 0; i < num_end; ++i) {
        if (text[i] != ',') number += text[i];  // Thousands separator
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (ec != std::errc{} || ptr != number.data() + number.size() || value < 0.0) {
        return std::nullopt;
    }

    auto unit = text.substr(num_end);
    while (!unit.empty() && std::isspace(static_cast<unsigned char>(unit.front()))) unit.remove_prefix(1);

    const int power = unit_power(unit);
    if (power < 0) return std::nullopt;

    const double bytes = value * std::pow(1024.0, power);
    if (bytes >= 1.8e19) return std::nullopt;
    return static_cast<std::uint64_t>(std::llround(bytes));
}

std::string format_bytes(std::uint64_t bytes) {
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < BYTE_UNITS.size()) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, BYTE_UNITS[unit]);
}

std::string format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string format_duration(std::uint64_t seconds) {
    const auto h = seconds / 3600;
    const auto m = (seconds % 3600) / 60;
    const auto s = seconds % 60;
    if (h > 0) {
        return fmt::format("{}:{:02}:{:02}", h, m, s);
    }
    return fmt::format("{}:{:02}", m, s);
}

} // namespace roomdl::core
