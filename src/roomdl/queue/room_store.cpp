// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/queue/room_store.hpp>
#include <roomdl/queue/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace roomdl::queue {

namespace {

constexpr int STATE_VERSION = 1;

} // namespace

void normalize_loaded(RoomData& room) {
    for (auto& item : room.items) {
        if (item.status == ItemStatus::downloading) {
            item.status = ItemStatus::available;
        }
        if (!is_terminal(item.status) && item.source_url.empty()) {
            item.status = ItemStatus::needs_resolve;
            item.error = "Source URL missing after restart";
        }
    }
    room.current_item.clear();
}

RoomStore::RoomStore(std::filesystem::path path)
    : path_(std::move(path)) {}

std::error_code RoomStore::save(const RoomData& room) const noexcept {
    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }

        nlohmann::json j = room;
        j["version"] = STATE_VERSION;

        auto temp = path_;
        temp += ".tmp";
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(QueueErrc::state_unwritable);
            }
            file << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
            if (!file.flush()) {
                return make_error_code(QueueErrc::state_unwritable);
            }
        }
        std::filesystem::rename(temp, path_);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Saving room state to {} failed: {}", path_.string(), e.what());
        return make_error_code(QueueErrc::state_unwritable);
    }
}

std::expected<RoomData, std::error_code> RoomStore::load() const noexcept {
    try {
        if (!std::filesystem::exists(path_)) {
            return RoomData{};
        }

        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(QueueErrc::state_unreadable));
        }

        auto j = nlohmann::json::parse(file);
        RoomData room = j.get<RoomData>();
        normalize_loaded(room);
        return room;
    } catch (const std::exception& e) {
        spdlog::error("Loading room state from {} failed: {}", path_.string(), e.what());
        return std::unexpected(make_error_code(QueueErrc::state_unreadable));
    }
}

} // namespace roomdl::queue
