// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/core/progress.hpp>
#include <roomdl/queue/item.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>

namespace roomdl::notify {

// Full room snapshot, observers replace their state with it
struct RoomUpdate {
    queue::RoomData room;
};

// Progress of the item currently downloading
struct FileProgress {
    std::string name;
    core::ProgressSample sample;
};

using Event = std::variant<RoomUpdate, FileProgress>;

// {"type":"roomUpdate","room":{...}} or {"type":"fileProgress",...}
[[nodiscard]] nlohmann::json to_message(const Event& event);

} // namespace roomdl::notify
