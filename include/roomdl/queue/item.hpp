// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roomdl::queue {

using TimePoint = std::chrono::system_clock::time_point;

enum class ItemStatus {
    available,
    downloading,
    success,
    failed,
    needs_resolve,
    corrupted,
};

[[nodiscard]] std::string_view to_string(ItemStatus status) noexcept;
[[nodiscard]] std::optional<ItemStatus> status_from_string(std::string_view text) noexcept;

// success, failed, needs-resolve and corrupted
[[nodiscard]] bool is_terminal(ItemStatus status) noexcept;

// States an explicit retry may leave
[[nodiscard]] bool is_retryable(ItemStatus status) noexcept;

struct Item {
    std::string name;             // Unique among active items, also the local file name
    std::string source_url;       // Empty for legacy items that need resolving
    std::string declared_size;    // As listed, e.g. "123.4 MiB"
    ItemStatus status{ItemStatus::available};
    std::string listing_url;      // Page the item was picked from
    std::string error;
    std::string file_path;
    TimePoint enqueued_at{};
    TimePoint updated_at{};

    // Parsed declared_size, advisory only
    [[nodiscard]] std::optional<std::uint64_t> declared_bytes() const noexcept;
};

// Terminal transition or organizer note
struct HistoryEntry {
    std::string name;
    std::string status;           // ItemStatus text, or "organizer"
    TimePoint timestamp{};
    std::string error;
};

constexpr std::size_t HISTORY_LIMIT = 500;

enum class RoomStatus {
    idle,
    downloading,
    ready,
    complete,
};

[[nodiscard]] std::string_view to_string(RoomStatus status) noexcept;

struct RoomStats {
    std::size_t total{0};
    std::size_t completed{0};
    std::size_t failed{0};        // failed, corrupted and needs-resolve
    std::size_t pending{0};
};

struct RoomData {
    std::vector<Item> items;      // Insertion order is queue order
    std::string current_item;
    std::vector<HistoryEntry> history;
    TimePoint last_activity{};
    std::string listing_url;
    std::string ruleset;

    [[nodiscard]] Item* find(std::string_view name) noexcept;
    [[nodiscard]] const Item* find(std::string_view name) const noexcept;

    // Append, dropping the oldest entries past HISTORY_LIMIT
    void record(HistoryEntry entry);
};

// Computed on every read, never stored
[[nodiscard]] RoomStatus derived_status(const RoomData& room) noexcept;
[[nodiscard]] RoomStats stats(const RoomData& room) noexcept;

[[nodiscard]] std::int64_t to_millis(TimePoint tp) noexcept;
[[nodiscard]] TimePoint from_millis(std::int64_t ms) noexcept;

void to_json(nlohmann::json& j, const Item& item);
void from_json(const nlohmann::json& j, Item& item);
void to_json(nlohmann::json& j, const HistoryEntry& entry);
void from_json(const nlohmann::json& j, HistoryEntry& entry);
void to_json(nlohmann::json& j, const RoomStats& s);

// Full room including the derived status and stats
void to_json(nlohmann::json& j, const RoomData& room);
void from_json(const nlohmann::json& j, RoomData& room);

} // namespace roomdl::queue
