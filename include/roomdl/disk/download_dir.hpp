// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace roomdl::disk {

struct CompletedFile {
    std::string name;
    std::filesystem::path path;
    std::uint64_t size{0};
    std::chrono::system_clock::time_point modified{};
};

// Regular files directly inside dir, newest first. In-progress ".part"
// files are skipped and a missing directory lists as empty.
[[nodiscard]] std::expected<std::vector<CompletedFile>, std::error_code>
list_completed(const std::filesystem::path& dir);

} // namespace roomdl::disk
