// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/notify/event.hpp>
#include <nlohmann/json.hpp>

namespace roomdl::notify {

namespace {

nlohmann::json encode(const RoomUpdate& update) {
    return nlohmann::json{
        {"type", "roomUpdate"},
        {"room", update.room},
    };
}

nlohmann::json encode(const FileProgress& progress) {
    const auto& s = progress.sample;
    nlohmann::json j{
        {"type", "fileProgress"},
        {"name", progress.name},
        {"downloaded", s.downloaded},
        {"total", nullptr},
        {"percent", s.percent},
        {"speed", s.speed_bps},
        {"averageSpeed", s.average_bps},
        {"elapsedMs", s.elapsed.count()},
        {"done", s.done},
    };
    if (s.total) {
        j["total"] = *s.total;
    }
    return j;
}

} // namespace

nlohmann::json to_message(const Event& event) {
    return std::visit([](const auto& e) { return encode(e); }, event);
}

} // namespace roomdl::notify
