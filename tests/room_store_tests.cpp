// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/queue/error.hpp>
#include <roomdl/queue/room_store.hpp>
#include "support/http_fixture.hpp"
#include <nlohmann/json.hpp>

using namespace roomdl::queue;
using namespace roomdl::test;

namespace {

Item make_item(std::string name, ItemStatus status, std::string url) {
    Item item;
    item.name = std::move(name);
    item.status = status;
    item.source_url = std::move(url);
    item.enqueued_at = from_millis(1700000000000);
    return item;
}

} // namespace

TEST_CASE("RoomStore - missing file loads empty room", "[store]") {
    TempDir dir;
    RoomStore store(dir / "state.json");
    auto room = store.load();
    REQUIRE(room.has_value());
    CHECK(room->items.empty());
    CHECK(room->ruleset.empty());
}

TEST_CASE("RoomStore - save then load keeps the queue", "[store]") {
    TempDir dir;
    RoomStore store(dir / "nested" / "state.json");

    RoomData room;
    room.items.push_back(make_item("a.zip", ItemStatus::success, "http://h/a.zip"));
    room.items.push_back(make_item("b.zip", ItemStatus::available, "http://h/b.zip"));
    room.items[0].file_path = "/data/a.zip";
    room.record({"a.zip", "success", from_millis(1700000001000), {}});
    room.listing_url = "http://h/";
    room.ruleset = "gba";

    REQUIRE_FALSE(store.save(room));
    CHECK_FALSE(std::filesystem::exists(dir / "nested" / "state.json.tmp"));

    auto json = nlohmann::json::parse(read_file(dir / "nested" / "state.json"));
    CHECK(json["version"] == 1);

    auto loaded = store.load();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->items.size() == 2);
    CHECK(loaded->items[0].name == "a.zip");
    CHECK(loaded->items[0].status == ItemStatus::success);
    CHECK(loaded->items[0].file_path == "/data/a.zip");
    CHECK(to_millis(loaded->items[0].enqueued_at) == 1700000000000);
    CHECK(loaded->items[1].status == ItemStatus::available);
    REQUIRE(loaded->history.size() == 1);
    CHECK(to_millis(loaded->history[0].timestamp) == 1700000001000);
    CHECK(loaded->listing_url == "http://h/");
    CHECK(loaded->ruleset == "gba");
}

TEST_CASE("RoomStore - interrupted and legacy items are normalized", "[store]") {
    TempDir dir;
    RoomStore store(dir / "state.json");

    RoomData room;
    room.items.push_back(make_item("active.zip", ItemStatus::downloading, "http://h/active.zip"));
    room.items.push_back(make_item("legacy.zip", ItemStatus::available, ""));
    room.items.push_back(make_item("old.zip", ItemStatus::failed, ""));
    room.current_item = "active.zip";
    REQUIRE_FALSE(store.save(room));

    auto loaded = store.load();
    REQUIRE(loaded.has_value());
    CHECK(loaded->current_item.empty());
    CHECK(loaded->items[0].status == ItemStatus::available);
    CHECK(loaded->items[1].status == ItemStatus::needs_resolve);
    CHECK_FALSE(loaded->items[1].error.empty());
    CHECK(loaded->items[2].status == ItemStatus::failed);
}

TEST_CASE("RoomStore - unreadable state is reported", "[store]") {
    TempDir dir;
    write_file(dir / "state.json", "{ not json");
    RoomStore store(dir / "state.json");

    auto loaded = store.load();
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error() == QueueErrc::state_unreadable);
}

TEST_CASE("RoomStore - unknown status text loads as failed", "[store]") {
    TempDir dir;
    write_file(dir / "state.json",
               R"({"items":[{"name":"x.zip","sourceUrl":"http://h/x.zip","status":"paused"}]})");
    RoomStore store(dir / "state.json");

    auto loaded = store.load();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->items.size() == 1);
    CHECK(loaded->items[0].status == ItemStatus::failed);
}
