// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/server/settings.hpp>
#include "support/http_fixture.hpp"
#include <string>
#include <vector>

using namespace roomdl::server;
using namespace roomdl::test;
using namespace std::chrono_literals;

namespace {

std::expected<Settings, std::string> parse(std::vector<std::string> args) {
    return parse_serve_arguments(args);
}

} // namespace

TEST_CASE("parse_serve_arguments - defaults", "[settings]") {
    auto s = parse({});
    REQUIRE(s.has_value());
    CHECK(s->address == "127.0.0.1");
    CHECK(s->port == 7070);
    CHECK(s->ruleset.empty());
    CHECK(s->idle_timeout == 1800s);
    CHECK_FALSE(s->log_file.has_value());

    auto options = s->transfer_options();
    CHECK(options.head_prefetch);
    CHECK(options.progress_interval == 500ms);
}

TEST_CASE("parse_serve_arguments - flags", "[settings]") {
    auto s = parse({"--address", "0.0.0.0", "--port", "9000", "--threads", "0",
                    "--download-dir", "/data/roms", "--ruleset", "n64", "--log", "/var/log/roomdl.log"});
    REQUIRE(s.has_value());
    CHECK(s->address == "0.0.0.0");
    CHECK(s->port == 9000);
    CHECK(s->threads == 1);
    CHECK(s->download_dir == "/data/roms");
    CHECK(s->ruleset == "n64");
    CHECK(s->log_file == std::filesystem::path("/var/log/roomdl.log"));
}

TEST_CASE("parse_serve_arguments - errors", "[settings]") {
    CHECK_FALSE(parse({"--port"}).has_value());
    CHECK_FALSE(parse({"--port", "http"}).has_value());
    CHECK_FALSE(parse({"--port", "70000"}).has_value());
    CHECK_FALSE(parse({"--colour", "blue"}).has_value());
    CHECK_FALSE(parse({"--config", "/nonexistent/roomdl.json"}).has_value());
}

TEST_CASE("parse_serve_arguments - config file then flags", "[settings]") {
    TempDir dir;
    write_file(dir / "roomdl.json", R"({
        "port": 8123,
        "ruleset": "psx",
        "idleTimeoutSec": 90,
        "progressIntervalMs": 250,
        "headPrefetch": false,
        "extensions": ["zip", "7z"],
        "logLevel": "debug",
        "somethingElse": true
    })");

    auto s = parse({"--ruleset", "gba", "--config", (dir / "roomdl.json").string()});
    REQUIRE(s.has_value());
    CHECK(s->port == 8123);
    CHECK(s->ruleset == "gba");
    CHECK(s->idle_timeout == 90s);
    CHECK(s->progress_interval == 250ms);
    CHECK_FALSE(s->head_prefetch);
    CHECK(s->extensions == std::vector<std::string>{"zip", "7z"});
    CHECK(s->log_level == "debug");
}

TEST_CASE("load_settings_file - rejects malformed files", "[settings]") {
    TempDir dir;
    Settings s;

    write_file(dir / "list.json", "[1, 2]");
    CHECK_FALSE(load_settings_file(dir / "list.json", s).has_value());

    write_file(dir / "typo.json", R"({"port": "eighty"})");
    CHECK_FALSE(load_settings_file(dir / "typo.json", s).has_value());
    CHECK(s.port == 7070);
}
