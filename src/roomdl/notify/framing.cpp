// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/notify/framing.hpp>
#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace roomdl::notify {

namespace {

std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer) noexcept {
    return (static_cast<std::uint32_t>(buffer[0]) << 24) |
           (static_cast<std::uint32_t>(buffer[1]) << 16) |
           (static_cast<std::uint32_t>(buffer[2]) << 8) |
           static_cast<std::uint32_t>(buffer[3]);
}

void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer) noexcept {
    buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
}

} // namespace

std::vector<std::uint8_t> encode_frame(const nlohmann::json& message) {
    // Replace invalid UTF-8 (odd file names) instead of throwing
    const auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() > MAX_FRAME_SIZE) {
        throw std::length_error("JSON message too large to frame");
    }
    std::vector<std::uint8_t> frame(FRAME_HEADER_SIZE + text.size());
    write_u32_be(static_cast<std::uint32_t>(text.size()), std::span<std::uint8_t>(frame).first<FRAME_HEADER_SIZE>());
    std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(FRAME_HEADER_SIZE));
    return frame;
}

std::expected<std::optional<DecodedFrame>, std::error_code>
try_decode_frame(std::span<const std::uint8_t> buffer) noexcept {
    if (buffer.size() < FRAME_HEADER_SIZE) {
        return std::optional<DecodedFrame>{};
    }
    const auto payload_size = read_u32_be(buffer.first<FRAME_HEADER_SIZE>());
    if (payload_size > MAX_FRAME_SIZE) {
        return std::unexpected(std::make_error_code(std::errc::message_size));
    }
    if (buffer.size() < FRAME_HEADER_SIZE + payload_size) {
        return std::optional<DecodedFrame>{};
    }

    auto payload = buffer.subspan(FRAME_HEADER_SIZE, payload_size);
    std::string_view text(reinterpret_cast<const char*>(payload.data()), payload.size());

    try {
        auto message = nlohmann::json::parse(text, nullptr, false);
        if (message.is_discarded()) {
            return std::unexpected(std::make_error_code(std::errc::bad_message));
        }
        return std::optional<DecodedFrame>{DecodedFrame{std::move(message), FRAME_HEADER_SIZE + payload_size}};
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace roomdl::notify
