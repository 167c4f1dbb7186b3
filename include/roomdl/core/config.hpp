// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace roomdl::core {

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t INACTIVITY_TIMEOUT_SEC = 60;                // No bytes for this long aborts the stream
constexpr std::uint32_t HEAD_TIMEOUT_SEC = 10;

constexpr std::chrono::milliseconds PROGRESS_INTERVAL{500};

constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;                 // 64 KB per curl read

constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr const char* USER_AGENT = "roomdl/0.1";
constexpr const char* PART_SUFFIX = ".part";

// Per-transfer knobs, defaults mirror the constants above
struct TransferOptions {
    bool head_prefetch{true};
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds inactivity_timeout{INACTIVITY_TIMEOUT_SEC};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};
};

} // namespace roomdl::core
