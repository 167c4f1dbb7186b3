// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/core/progress.hpp>

using namespace roomdl::core;
using namespace std::chrono_literals;

namespace {
constexpr std::uint64_t MiB = 1024 * 1024;
}

TEST_CASE("compute_percent - known total", "[progress]") {
    CHECK(compute_percent(0, 100, false) == 0);
    CHECK(compute_percent(50, 100, false) == 50);
    CHECK(compute_percent(996, 1000, false) == 99);
    CHECK(compute_percent(1000, 1000, false) == 99);
    CHECK(compute_percent(1000, 1000, true) == 100);
}

TEST_CASE("compute_percent - unknown total", "[progress]") {
    CHECK(compute_percent(0, std::nullopt, false) == 5);
    CHECK(compute_percent(MiB, std::nullopt, false) == 7);
    CHECK(compute_percent(10 * MiB, std::nullopt, false) == 25);
    CHECK(compute_percent(1000 * MiB, std::nullopt, false) == 95);
    CHECK(compute_percent(0, 0, false) == 5);
    CHECK(compute_percent(3, std::nullopt, true) == 100);
}

TEST_CASE("ProgressMeter - throttles samples", "[progress]") {
    auto t0 = ProgressMeter::Clock::time_point{} + 1h;
    ProgressMeter meter(500ms, t0);
    meter.set_total(4 * MiB);

    CHECK_FALSE(meter.update(MiB, t0 + 100ms).has_value());
    CHECK_FALSE(meter.update(2 * MiB, t0 + 400ms).has_value());

    auto sample = meter.update(2 * MiB, t0 + 500ms);
    REQUIRE(sample.has_value());
    CHECK(sample->downloaded == 2 * MiB);
    CHECK(sample->percent == 50);
    CHECK(sample->elapsed == 500ms);
    CHECK_FALSE(sample->done);
    CHECK(sample->speed_bps == Catch::Approx(4.0 * MiB));

    // Interval restarts from the last emitted sample
    CHECK_FALSE(meter.update(3 * MiB, t0 + 900ms).has_value());
    auto next = meter.update(3 * MiB, t0 + 1000ms);
    REQUIRE(next.has_value());
    CHECK(next->speed_bps == Catch::Approx(2.0 * MiB));
    CHECK(next->average_bps == Catch::Approx(3.0 * MiB));
}

TEST_CASE("ProgressMeter - never reports fewer bytes", "[progress]") {
    auto t0 = ProgressMeter::Clock::time_point{} + 1h;
    ProgressMeter meter(0ms, t0);

    auto a = meter.update(1000, t0 + 1ms);
    REQUIRE(a.has_value());
    auto b = meter.update(10, t0 + 2ms);
    REQUIRE(b.has_value());
    CHECK(b->downloaded == 1000);
}

TEST_CASE("ProgressMeter - finish pins total", "[progress]") {
    auto t0 = ProgressMeter::Clock::time_point{} + 1h;
    ProgressMeter meter(500ms, t0);

    auto sample = meter.finish(12345, t0 + 2s);
    CHECK(sample.done);
    CHECK(sample.percent == 100);
    REQUIRE(sample.total.has_value());
    CHECK(*sample.total == 12345);
    CHECK(meter.total() == 12345u);
}
