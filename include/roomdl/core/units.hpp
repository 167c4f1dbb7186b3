// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace roomdl::core {

// Parse a listing size column ("123.4 MiB", "2 GB", "512K", "1024") into bytes.
// Decimal and binary suffixes are both treated as powers of 1024, matching how
// directory indexes print them. Returns nullopt for "-" or anything unparseable.
[[nodiscard]] std::optional<std::uint64_t> parse_size(std::string_view text) noexcept;

// 1536 -> "1.5 KiB"
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

// 1048576 -> "1.0 MiB/s"
[[nodiscard]] std::string format_speed(std::uint64_t bps);

// 3725 -> "1:02:05", 65 -> "1:05"
[[nodiscard]] std::string format_duration(std::uint64_t seconds);

} // namespace roomdl::core
