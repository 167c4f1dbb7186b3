// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/queue/item.hpp>
#include <expected>
#include <filesystem>
#include <system_error>

namespace roomdl::queue {

// JSON persistence of the room between daemon runs
class RoomStore {
public:
    explicit RoomStore(std::filesystem::path path);

    // Write atomically through a temporary file
    [[nodiscard]] std::error_code save(const RoomData& room) const noexcept;

    // A missing file loads as an empty room. Loaded items are normalized,
    // see normalize_loaded().
    [[nodiscard]] std::expected<RoomData, std::error_code> load() const noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// Downloading items go back to available, non-terminal items without a
// URL become needs-resolve, the current item is cleared
void normalize_loaded(RoomData& room);

} // namespace roomdl::queue
