// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/catalog/listing_scraper.hpp>
#include "support/http_fixture.hpp"

using namespace roomdl;
using namespace roomdl::catalog;
using namespace roomdl::test;

namespace {

constexpr const char* APACHE_INDEX = R"(<!DOCTYPE html>
<html><head><title>Index of /files/roms</title></head><body>
<table>
<tr><th><a href="?C=N;O=D">Name</a></th><th><a href="?C=S;O=A">Size</a></th></tr>
<tr><td><a href="/files/">Parent Directory</a></td><td>-</td></tr>
<tr><td><a href="Super%20Mario%2064%20(USA).zip">Super Mario 64 (USA).zip</a></td><td align="right">8.1 MiB</td></tr>
<tr><td><a href="Zelda.7z">Zelda &amp; Friends.7z</a></td><td> 1.2G </td></tr>
<tr><td><a href="extras/">extras/</a></td><td>-</td></tr>
<tr><td><A HREF='Tetris.gb'><img src="x.png"> Tetris.gb</A></td><td>-</td></tr>
</table></body></html>)";

constexpr const char* NGINX_INDEX = R"(<html><head><title>Index of /roms/</title></head>
<body><h1>Index of /roms/</h1><hr><pre><a href="../">../</a>
<a href="A%20very%20long%20name%20that%20gets%20cut.zip">A very long name that gets..&gt;</a> 01-Jan-2024 10:00  12345678
<a href="b.zip">b.zip</a>                            01-Jan-2024 10:00  100
<a href="#top">top</a>
</pre><hr></body></html>)";

core::Url page(const char* url) {
    auto parsed = core::Url::parse(url);
    REQUIRE(parsed.has_value());
    return *parsed;
}

} // namespace

TEST_CASE("decode_entities", "[listing]") {
    CHECK(decode_entities("a &amp; b") == "a & b");
    CHECK(decode_entities("&lt;x&gt; &quot;q&quot; &apos;") == "<x> \"q\" '");
    CHECK(decode_entities("&#65;&#x42;") == "AB");
    CHECK(decode_entities("&#233;") == "\xC3\xA9");
    CHECK(decode_entities("AT&T") == "AT&T");
    CHECK(decode_entities("&bogus;") == "&bogus;");
}

TEST_CASE("matches_extension", "[listing]") {
    CHECK(matches_extension("a.zip", {}));
    CHECK(matches_extension("a.ZIP", {"zip"}));
    CHECK(matches_extension("a.7z", {".zip", ".7z"}));
    CHECK_FALSE(matches_extension("zip", {"zip"}));
    CHECK_FALSE(matches_extension("a.gzip", {"zip"}));
    CHECK_FALSE(matches_extension("a.zip", {""}));
}

TEST_CASE("parse_listing - table index", "[listing]") {
    auto entries = parse_listing(APACHE_INDEX, page("http://host/files/roms/"), {});
    REQUIRE(entries.size() == 3);

    CHECK(entries[0].name == "Super Mario 64 (USA).zip");
    CHECK(entries[0].download_url == "http://host/files/roms/Super%20Mario%2064%20(USA).zip");
    CHECK(entries[0].size == "8.1 MiB");

    CHECK(entries[1].name == "Zelda & Friends.7z");
    CHECK(entries[1].download_url == "http://host/files/roms/Zelda.7z");
    CHECK(entries[1].size == "1.2G");

    CHECK(entries[2].name == "Tetris.gb");
    CHECK_FALSE(entries[2].size.has_value());
}

TEST_CASE("parse_listing - extension filter", "[listing]") {
    auto zips = parse_listing(APACHE_INDEX, page("http://host/files/roms/"), {"zip"});
    REQUIRE(zips.size() == 1);
    CHECK(zips[0].name == "Super Mario 64 (USA).zip");

    auto sevens = parse_listing(APACHE_INDEX, page("http://host/files/roms/"), {".7Z", "gb"});
    CHECK(sevens.size() == 2);
}

TEST_CASE("parse_listing - bare anchors without a table", "[listing]") {
    auto entries = parse_listing(NGINX_INDEX, page("http://mirror:8080/roms/"), {});
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].name == "A very long name that gets cut.zip");
    CHECK(entries[0].download_url == "http://mirror:8080/roms/A%20very%20long%20name%20that%20gets%20cut.zip");
    CHECK(entries[1].name == "b.zip");
}

TEST_CASE("parse_listing - page without links", "[listing]") {
    CHECK(parse_listing("<html><body>Nothing here</body></html>", page("http://h/"), {}).empty());
}

TEST_CASE("ListingScraper - scrapes over HTTP", "[listing]") {
    HttpFixture server;
    server.route("/roms/", Response::html(APACHE_INDEX));
    ListingScraper scraper({}, {"zip"});

    auto entries = scraper.scrape(server.url("/roms/"));
    REQUIRE(entries.has_value());
    REQUIRE(entries->size() == 1);
    CHECK(entries->front().download_url == server.url("/roms/Super%20Mario%2064%20(USA).zip"));

    auto missing = scraper.scrape(server.url("/nothing/"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().http_status == 404);

    auto invalid = scraper.scrape("not a url");
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().is(core::TransferErrc::invalid_url));
}
