// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/notify/event.hpp>
#include <roomdl/notify/framing.hpp>
#include <nlohmann/json.hpp>

using namespace roomdl;
using namespace roomdl::notify;
using namespace std::chrono_literals;

TEST_CASE("encode_frame - big-endian length prefix", "[framing]") {
    nlohmann::json message = {{"type", "snapshot"}, {"id", 7}};
    auto frame = encode_frame(message);
    std::string text = message.dump();

    REQUIRE(frame.size() == FRAME_HEADER_SIZE + text.size());
    std::uint32_t length = (std::uint32_t{frame[0]} << 24) | (std::uint32_t{frame[1]} << 16)
                         | (std::uint32_t{frame[2]} << 8) | std::uint32_t{frame[3]};
    CHECK(length == text.size());
    CHECK(std::string(frame.begin() + FRAME_HEADER_SIZE, frame.end()) == text);
}

TEST_CASE("try_decode_frame - partial and back-to-back frames", "[framing]") {
    auto first = encode_frame({{"type", "enqueue"}});
    auto second = encode_frame({{"type", "cancel"}, {"name", "a.zip"}});

    std::vector<std::uint8_t> buffer(first);
    buffer.insert(buffer.end(), second.begin(), second.end());

    SECTION("Header only") {
        auto r = try_decode_frame(std::span(buffer.data(), 3));
        REQUIRE(r.has_value());
        CHECK_FALSE(r->has_value());
    }

    SECTION("Payload incomplete") {
        auto r = try_decode_frame(std::span(buffer.data(), first.size() - 1));
        REQUIRE(r.has_value());
        CHECK_FALSE(r->has_value());
    }

    SECTION("Two frames in one buffer") {
        auto r1 = try_decode_frame(buffer);
        REQUIRE(r1.has_value());
        REQUIRE(r1->has_value());
        CHECK((*r1)->message["type"] == "enqueue");
        CHECK((*r1)->bytes_consumed == first.size());

        auto rest = std::span<const std::uint8_t>(buffer).subspan((*r1)->bytes_consumed);
        auto r2 = try_decode_frame(rest);
        REQUIRE(r2.has_value());
        REQUIRE(r2->has_value());
        CHECK((*r2)->message["name"] == "a.zip");
    }
}

TEST_CASE("try_decode_frame - rejects bad input", "[framing]") {
    SECTION("Oversized length") {
        std::vector<std::uint8_t> buffer{0x7f, 0xff, 0xff, 0xff, '{'};
        auto r = try_decode_frame(buffer);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == std::errc::message_size);
    }

    SECTION("Invalid JSON") {
        std::vector<std::uint8_t> buffer{0, 0, 0, 3, '{', 'x', '}'};
        auto r = try_decode_frame(buffer);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == std::errc::bad_message);
    }
}

TEST_CASE("encode_frame - invalid UTF-8 is replaced, not thrown", "[framing]") {
    nlohmann::json message = {{"name", std::string("bad\xff name")}};
    std::vector<std::uint8_t> frame;
    REQUIRE_NOTHROW(frame = encode_frame(message));
    auto r = try_decode_frame(frame);
    REQUIRE(r.has_value());
    REQUIRE(r->has_value());
    CHECK((*r)->message["name"].get<std::string>().starts_with("bad"));
}

TEST_CASE("to_message - fileProgress", "[framing]") {
    FileProgress progress;
    progress.name = "game.zip";
    progress.sample.downloaded = 512;
    progress.sample.percent = 50;
    progress.sample.elapsed = 1500ms;

    auto j = to_message(progress);
    CHECK(j["type"] == "fileProgress");
    CHECK(j["name"] == "game.zip");
    CHECK(j["downloaded"] == 512);
    CHECK(j["total"].is_null());
    CHECK(j["percent"] == 50);
    CHECK(j["elapsedMs"] == 1500);
    CHECK(j["done"] == false);

    progress.sample.total = 1024;
    CHECK(to_message(progress)["total"] == 1024);
}

TEST_CASE("to_message - roomUpdate", "[framing]") {
    RoomUpdate update;
    queue::Item item;
    item.name = "a.zip";
    item.status = queue::ItemStatus::downloading;
    update.room.items.push_back(item);
    update.room.current_item = "a.zip";

    auto j = to_message(update);
    CHECK(j["type"] == "roomUpdate");
    CHECK(j["room"]["status"] == "downloading");
    CHECK(j["room"]["currentItemName"] == "a.zip");
    CHECK(j["room"]["items"].size() == 1);
}
