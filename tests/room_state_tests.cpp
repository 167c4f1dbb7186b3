// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/queue/room_state.hpp>
#include <nlohmann/json.hpp>
#include <variant>
#include <vector>

using namespace roomdl;
using namespace roomdl::queue;
using namespace std::chrono_literals;

namespace {

Item make_item(std::string name, ItemStatus status = ItemStatus::available) {
    Item item;
    item.name = std::move(name);
    item.source_url = "http://host/" + item.name;
    item.status = status;
    return item;
}

// Collects every RoomUpdate published on a channel
struct Recorder {
    std::vector<RoomData> rooms;

    notify::Subscriber subscriber() {
        return [this](const notify::Event& e) {
            if (auto* update = std::get_if<notify::RoomUpdate>(&e)) {
                rooms.push_back(update->room);
            }
        };
    }
};

} // namespace

TEST_CASE("ItemStatus - text form", "[room]") {
    CHECK(to_string(ItemStatus::needs_resolve) == "needs-resolve");
    CHECK(status_from_string("corrupted") == ItemStatus::corrupted);
    CHECK_FALSE(status_from_string("paused").has_value());

    CHECK_FALSE(is_terminal(ItemStatus::available));
    CHECK_FALSE(is_terminal(ItemStatus::downloading));
    CHECK(is_terminal(ItemStatus::success));
    CHECK(is_retryable(ItemStatus::needs_resolve));
    CHECK_FALSE(is_retryable(ItemStatus::success));
}

TEST_CASE("derived_status and stats", "[room]") {
    RoomData room;
    CHECK(derived_status(room) == RoomStatus::idle);

    room.items.push_back(make_item("a", ItemStatus::success));
    room.items.push_back(make_item("b", ItemStatus::failed));
    CHECK(derived_status(room) == RoomStatus::complete);

    room.items.push_back(make_item("c"));
    CHECK(derived_status(room) == RoomStatus::ready);

    room.items.push_back(make_item("d", ItemStatus::downloading));
    CHECK(derived_status(room) == RoomStatus::downloading);

    room.items.push_back(make_item("e", ItemStatus::needs_resolve));
    room.items.push_back(make_item("f", ItemStatus::corrupted));
    auto s = stats(room);
    CHECK(s.total == 6);
    CHECK(s.completed == 1);
    CHECK(s.failed == 3);
    CHECK(s.pending == 1);
}

TEST_CASE("RoomData::record caps history", "[room]") {
    RoomData room;
    for (std::size_t i = 0; i < HISTORY_LIMIT + 20; ++i) {
        room.record({std::to_string(i), "success", {}, {}});
    }
    REQUIRE(room.history.size() == HISTORY_LIMIT);
    CHECK(room.history.front().name == "20");
    CHECK(room.history.back().name == std::to_string(HISTORY_LIMIT + 19));
}

TEST_CASE("RoomData - JSON shape", "[room]") {
    RoomData room;
    auto item = make_item("Game (USA).zip");
    item.declared_size = "1.5 KiB";
    item.listing_url = "http://host/";
    room.items.push_back(item);
    room.current_item = "";
    room.ruleset = "n64";

    nlohmann::json j = room;
    CHECK(j["status"] == "ready");
    CHECK(j["stats"]["pending"] == 1);
    CHECK(j["items"][0]["name"] == "Game (USA).zip");
    CHECK(j["items"][0]["sourceUrl"] == "http://host/Game (USA).zip");
    CHECK(j["items"][0]["size"] == "1.5 KiB");
    CHECK(j["items"][0]["sizeBytes"] == 1536);
    CHECK(j["items"][0]["status"] == "available");
    CHECK(j["ruleset"] == "n64");

    auto back = j.get<RoomData>();
    REQUIRE(back.items.size() == 1);
    CHECK(back.items[0].name == item.name);
    CHECK(back.items[0].listing_url == "http://host/");
    CHECK(back.ruleset == "n64");
}

TEST_CASE("RoomState - mutations publish in order", "[room]") {
    notify::Channel channel;
    RoomState room(channel, 600s);
    Recorder recorder;
    auto id = channel.subscribe(recorder.subscriber());

    room.mutate([](RoomData& d) { d.items.push_back(make_item("a")); });
    room.mutate([](RoomData& d) { d.items.push_back(make_item("b")); });

    bool changed = room.try_mutate([](RoomData&) { return false; });
    CHECK_FALSE(changed);

    REQUIRE(recorder.rooms.size() == 2);
    CHECK(recorder.rooms[0].items.size() == 1);
    CHECK(recorder.rooms[1].items.size() == 2);

    auto count = room.mutate([](RoomData& d) { return d.items.size(); });
    CHECK(count == 2);
    CHECK(recorder.rooms.size() == 3);

    auto names = room.inspect([](const RoomData& d) { return d.items.front().name; });
    CHECK(names == "a");
    CHECK(recorder.rooms.size() == 3);

    channel.unsubscribe(id);
}

TEST_CASE("RoomState - connect delivers snapshot first", "[room]") {
    notify::Channel channel;
    RoomState room(channel, 600s);
    room.mutate([](RoomData& d) { d.items.push_back(make_item("a")); });

    Recorder recorder;
    auto id = room.connect(recorder.subscriber());
    REQUIRE(recorder.rooms.size() == 1);
    CHECK(recorder.rooms[0].items.size() == 1);

    room.mutate([](RoomData& d) { d.items.push_back(make_item("b")); });
    REQUIRE(recorder.rooms.size() == 2);
    CHECK(recorder.rooms[1].items.size() == 2);

    channel.unsubscribe(id);
    CHECK(channel.subscriber_count() == 0);
}

TEST_CASE("RoomState - idle sweep", "[room]") {
    notify::Channel channel;
    RoomState room(channel, 60s);
    room.mutate([](RoomData& d) {
        d.items.push_back(make_item("a", ItemStatus::success));
        d.record({"a", "success", {}, {}});
        d.listing_url = "http://host/";
    });
    auto last = room.snapshot().last_activity;

    SECTION("Not idle long enough") {
        CHECK_FALSE(room.idle_sweep(last + 30s));
        CHECK(room.snapshot().items.size() == 1);
    }

    SECTION("Idle room is cleared but keeps settings") {
        CHECK(room.idle_sweep(last + 61s));
        auto snap = room.snapshot();
        CHECK(snap.items.empty());
        CHECK(snap.history.empty());
        CHECK(snap.listing_url == "http://host/");
        CHECK_FALSE(room.idle_sweep(snap.last_activity + 1h));
    }

    SECTION("Downloading room is never swept") {
        room.mutate([](RoomData& d) {
            d.items.push_back(make_item("b", ItemStatus::downloading));
            d.current_item = "b";
        });
        auto now = room.snapshot().last_activity + 24h;
        CHECK_FALSE(room.idle_sweep(now));
        CHECK(room.snapshot().items.size() == 2);
    }
}
