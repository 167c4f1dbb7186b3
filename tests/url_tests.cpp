// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/core/url.hpp>

using namespace roomdl::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/roms/game.zip");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
        CHECK(result->host() == "example.com");
        CHECK(result->path() == "/roms/game.zip");
        CHECK(result->is_secure());
        CHECK(result->is_http());
    }

    SECTION("Scheme is lower-cased") {
        auto result = Url::parse("HTTP://Example.com/a");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "http");
    }

    SECTION("Port, query and fragment") {
        auto result = Url::parse("http://127.0.0.1:8080/list?sort=name#top");
        REQUIRE(result.has_value());
        CHECK(result->port() == "8080");
        CHECK(result->query() == "sort=name");
        CHECK(result->fragment() == "top");
        CHECK(result->full() == "http://127.0.0.1:8080/list?sort=name#top");
    }

    SECTION("Host only gets root path") {
        auto result = Url::parse("http://example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
        CHECK(result->base() == "http://example.com");
    }

    SECTION("IPv6 host") {
        auto result = Url::parse("http://[::1]:9000/x");
        REQUIRE(result.has_value());
        CHECK(result->host() == "[::1]");
        CHECK(result->port() == "9000");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK_FALSE(Url::parse("").has_value());
    CHECK_FALSE(Url::parse("example.com/file.zip").has_value());
    CHECK_FALSE(Url::parse("http:///nohost").has_value());
    CHECK_FALSE(Url::parse("http://host:80a/").has_value());

    auto result = Url::parse("not a url");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == TransferErrc::invalid_url);
}

TEST_CASE("Url::resolve - relative references", "[url]") {
    auto base = Url::parse("http://host/files/roms/index.html?x=1");
    REQUIRE(base.has_value());

    SECTION("Relative file") {
        auto r = Url::resolve(*base, "game%20one.zip");
        REQUIRE(r.has_value());
        CHECK(r->full() == "http://host/files/roms/game%20one.zip");
    }

    SECTION("Parent directory") {
        auto r = Url::resolve(*base, "../other/a.zip");
        REQUIRE(r.has_value());
        CHECK(r->full() == "http://host/files/other/a.zip");
    }

    SECTION("Absolute path") {
        auto r = Url::resolve(*base, "/top.zip");
        REQUIRE(r.has_value());
        CHECK(r->full() == "http://host/top.zip");
    }

    SECTION("Scheme-relative") {
        auto r = Url::resolve(*base, "//mirror.example/a.zip");
        REQUIRE(r.has_value());
        CHECK(r->full() == "http://mirror.example/a.zip");
    }

    SECTION("Absolute URL replaces base") {
        auto r = Url::resolve(*base, "https://cdn.example/b.zip");
        REQUIRE(r.has_value());
        CHECK(r->full() == "https://cdn.example/b.zip");
    }

    SECTION("Query-only keeps path") {
        auto r = Url::resolve(*base, "?page=2");
        REQUIRE(r.has_value());
        CHECK(r->full() == "http://host/files/roms/index.html?page=2");
    }

    SECTION("Whitespace around Location is ignored") {
        auto r = Url::resolve(*base, "  next.zip \r");
        REQUIRE(r.has_value());
        CHECK(r->path() == "/files/roms/next.zip");
    }
}

TEST_CASE("Url::filename extraction", "[url]") {
    CHECK(Url::parse("https://example.com/myfile.zip")->filename() == "myfile.zip");
    CHECK(Url::parse("https://example.com/download.php?id=123")->filename() == "download.php");
    CHECK(Url::parse("https://example.com/folder/")->filename() == "index.html");
    CHECK(Url::parse("https://example.com/Super%20Game%20(USA).zip")->filename() == "Super Game (USA).zip");
}

TEST_CASE("Url::directory", "[url]") {
    CHECK(Url::parse("http://h:1/a/b/c.zip")->directory() == "http://h:1/a/b/");
    CHECK(Url::parse("http://h/")->directory() == "http://h/");
}

TEST_CASE("percent_decode", "[url]") {
    CHECK(percent_decode("a%20b") == "a b");
    CHECK(percent_decode("%41%42") == "AB");
    CHECK(percent_decode("100%") == "100%");
    CHECK(percent_decode("%zz") == "%zz");
}
