// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/core/units.hpp>

using namespace roomdl::core;

TEST_CASE("parse_size - listing columns", "[units]") {
    CHECK(parse_size("1024") == 1024u);
    CHECK(parse_size("1K") == 1024u);
    CHECK(parse_size("1.5 KiB") == 1536u);
    CHECK(parse_size("2 MB") == 2u * 1024 * 1024);
    CHECK(parse_size("  3G ") == 3ull * 1024 * 1024 * 1024);
    CHECK(parse_size("1,024 B") == 1024u);
    CHECK(parse_size("0.5m") == 512u * 1024);
}

TEST_CASE("parse_size - rejects garbage", "[units]") {
    CHECK_FALSE(parse_size("").has_value());
    CHECK_FALSE(parse_size("-").has_value());
    CHECK_FALSE(parse_size("MiB").has_value());
    CHECK_FALSE(parse_size("12 parsecs").has_value());
    CHECK_FALSE(parse_size("1.2.3 MB").has_value());
}

TEST_CASE("format_bytes", "[units]") {
    CHECK(format_bytes(0) == "0 B");
    CHECK(format_bytes(1023) == "1023 B");
    CHECK(format_bytes(1536) == "1.5 KiB");
    CHECK(format_bytes(10ull * 1024 * 1024) == "10.0 MiB");
    CHECK(format_speed(1048576) == "1.0 MiB/s");
}

TEST_CASE("format_duration", "[units]") {
    CHECK(format_duration(0) == "0:00");
    CHECK(format_duration(65) == "1:05");
    CHECK(format_duration(3725) == "1:02:05");
}
