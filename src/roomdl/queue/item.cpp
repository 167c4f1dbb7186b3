// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/queue/item.hpp>
#include <roomdl/core/units.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace roomdl::queue {

std::string_view to_string(ItemStatus status) noexcept {
    switch (status) {
        case ItemStatus::available:     return "available";
        case ItemStatus::downloading:   return "downloading";
        case ItemStatus::success:       return "success";
        case ItemStatus::failed:        return "failed";
        case ItemStatus::needs_resolve: return "needs-resolve";
        case ItemStatus::corrupted:     return "corrupted";
    }
    return "failed";
}

std::optional<ItemStatus> status_from_string(std::string_view text) noexcept {
    if (text == "available")     return ItemStatus::available;
    if (text == "downloading")   return ItemStatus::downloading;
    if (text == "success")       return ItemStatus::success;
    if (text == "failed")        return ItemStatus::failed;
    if (text == "needs-resolve") return ItemStatus::needs_resolve;
    if (text == "corrupted")     return ItemStatus::corrupted;
    return std::nullopt;
}

bool is_terminal(ItemStatus status) noexcept {
    return status != ItemStatus::available && status != ItemStatus::downloading;
}

bool is_retryable(ItemStatus status) noexcept {
    return status == ItemStatus::failed
        || status == ItemStatus::corrupted
        || status == ItemStatus::needs_resolve;
}

std::string_view to_string(RoomStatus status) noexcept {
    switch (status) {
        case RoomStatus::idle:        return "idle";
        case RoomStatus::downloading: return "downloading";
        case RoomStatus::ready:       return "ready";
        case RoomStatus::complete:    return "complete";
    }
    return "idle";
}

std::optional<std::uint64_t> Item::declared_bytes() const noexcept {
    return core::parse_size(declared_size);
}

//=============================================================================
// RoomData
//=============================================================================

Item* RoomData::find(std::string_view name) noexcept {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const Item& item) { return item.name == name; });
    return it == items.end() ? nullptr : &*it;
}

const Item* RoomData::find(std::string_view name) const noexcept {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const Item& item) { return item.name == name; });
    return it == items.end() ? nullptr : &*it;
}

void RoomData::record(HistoryEntry entry) {
    history.push_back(std::move(entry));
    if (history.size() > HISTORY_LIMIT) {
        history.erase(history.begin(),
                      history.begin() + static_cast<std::ptrdiff_t>(history.size() - HISTORY_LIMIT));
    }
}

RoomStatus derived_status(const RoomData& room) noexcept {
    if (room.items.empty()) {
        return RoomStatus::idle;
    }
    bool any_available = false;
    for (const auto& item : room.items) {
        if (item.status == ItemStatus::downloading) return RoomStatus::downloading;
        if (item.status == ItemStatus::available) any_available = true;
    }
    return any_available ? RoomStatus::ready : RoomStatus::complete;
}

RoomStats stats(const RoomData& room) noexcept {
    RoomStats s;
    s.total = room.items.size();
    for (const auto& item : room.items) {
        switch (item.status) {
            case ItemStatus::success:       ++s.completed; break;
            case ItemStatus::failed:
            case ItemStatus::corrupted:
            case ItemStatus::needs_resolve: ++s.failed; break;
            case ItemStatus::available:     ++s.pending; break;
            case ItemStatus::downloading:   break;
        }
    }
    return s;
}

std::int64_t to_millis(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_millis(std::int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

//=============================================================================
// JSON
//=============================================================================

void to_json(nlohmann::json& j, const Item& item) {
    j = nlohmann::json{
        {"name", item.name},
        {"sourceUrl", item.source_url},
        {"size", item.declared_size},
        {"status", std::string(to_string(item.status))},
        {"listingUrl", item.listing_url},
        {"error", item.error},
        {"filePath", item.file_path},
        {"enqueuedAt", to_millis(item.enqueued_at)},
        {"updatedAt", to_millis(item.updated_at)},
    };
    if (auto bytes = item.declared_bytes()) {
        j["sizeBytes"] = *bytes;
    }
}

void from_json(const nlohmann::json& j, Item& item) {
    item.name = j.at("name").get<std::string>();
    item.source_url = j.value("sourceUrl", std::string{});
    item.declared_size = j.value("size", std::string{});
    auto status = status_from_string(j.value("status", std::string{"available"}));
    item.status = status.value_or(ItemStatus::failed);
    item.listing_url = j.value("listingUrl", std::string{});
    item.error = j.value("error", std::string{});
    item.file_path = j.value("filePath", std::string{});
    item.enqueued_at = from_millis(j.value("enqueuedAt", std::int64_t{0}));
    item.updated_at = from_millis(j.value("updatedAt", std::int64_t{0}));
}

void to_json(nlohmann::json& j, const HistoryEntry& entry) {
    j = nlohmann::json{
        {"name", entry.name},
        {"status", entry.status},
        {"timestamp", to_millis(entry.timestamp)},
        {"error", entry.error},
    };
}

void from_json(const nlohmann::json& j, HistoryEntry& entry) {
    entry.name = j.at("name").get<std::string>();
    entry.status = j.value("status", std::string{});
    entry.timestamp = from_millis(j.value("timestamp", std::int64_t{0}));
    entry.error = j.value("error", std::string{});
}

void to_json(nlohmann::json& j, const RoomStats& s) {
    j = nlohmann::json{
        {"total", s.total},
        {"completed", s.completed},
        {"failed", s.failed},
        {"pending", s.pending},
    };
}

void to_json(nlohmann::json& j, const RoomData& room) {
    j = nlohmann::json{
        {"status", std::string(to_string(derived_status(room)))},
        {"stats", stats(room)},
        {"items", room.items},
        {"currentItemName", room.current_item},
        {"history", room.history},
        {"lastActivity", to_millis(room.last_activity)},
        {"listingUrl", room.listing_url},
        {"ruleset", room.ruleset},
    };
}

void from_json(const nlohmann::json& j, RoomData& room) {
    room.items = j.value("items", std::vector<Item>{});
    room.current_item = j.value("currentItemName", std::string{});
    room.history = j.value("history", std::vector<HistoryEntry>{});
    room.last_activity = from_millis(j.value("lastActivity", std::int64_t{0}));
    room.listing_url = j.value("listingUrl", std::string{});
    room.ruleset = j.value("ruleset", std::string{});
}

} // namespace roomdl::queue
