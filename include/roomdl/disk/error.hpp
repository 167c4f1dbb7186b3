// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace roomdl::disk {

// Failures while writing a download to its .part file or promoting it
enum class DiskErrc {
    not_found = 1,
    permission_denied,
    no_space,
    bad_path,
    already_exists,
    write_failed,
    rename_failed,
    not_open,
};

const std::error_category& disk_category() noexcept;

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_category()};
}

// Closest DiskErrc for an errno value, fallback when none fits
[[nodiscard]] std::error_code from_errno(int err, DiskErrc fallback) noexcept;

} // namespace roomdl::disk

namespace std {

template<>
struct is_error_code_enum<roomdl::disk::DiskErrc> : true_type {};

} // namespace std
