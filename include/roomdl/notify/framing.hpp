// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace roomdl::notify {

// 4-byte big-endian length, then that many bytes of JSON text
constexpr std::size_t FRAME_HEADER_SIZE = sizeof(std::uint32_t);
constexpr std::uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;

struct DecodedFrame {
    nlohmann::json message;
    std::size_t bytes_consumed{0};
};

[[nodiscard]] std::vector<std::uint8_t> encode_frame(const nlohmann::json& message);

// nullopt while the buffer holds less than one whole frame. Oversized
// lengths yield message_size, unparsable payloads bad_message.
[[nodiscard]] std::expected<std::optional<DecodedFrame>, std::error_code>
try_decode_frame(std::span<const std::uint8_t> buffer) noexcept;

} // namespace roomdl::notify
