#include <catch2/catch_test_macros.hpp>
#include "../src/bar_synth.hpp"
#include "test_helpers.hpp"

TEST_CASE("Bar synthesis", "[bar_synth]") {
    const int64_t day = testdata::kDay;

    SECTION("Hourly bars roll up into 4h buckets") {
        BarSynthesizer synth(4 * 3600);
        Series hourly = {
            {day,            100.0, 105.0, 99.0,  104.0, 10.0},
            {day + 3600,     104.0, 110.0, 103.0, 108.0, 20.0},
            {day + 2 * 3600, 108.0, 109.0, 95.0,  96.0,  30.0},
            {day + 3 * 3600, 96.0,  101.0, 96.0,  100.0, 40.0},
            {day + 4 * 3600, 100.0, 102.0, 98.0,  101.0, 50.0},
        };

        auto bars = synth.aggregate(hourly);
        REQUIRE(bars.size() == 2);

        REQUIRE(bars[0].timestamp == day);
        REQUIRE(bars[0].open == 100.0);
        REQUIRE(bars[0].high == 110.0);
        REQUIRE(bars[0].low == 95.0);
        REQUIRE(bars[0].close == 100.0);
        REQUIRE(bars[0].volume == 100.0);

        REQUIRE(bars[1].timestamp == day + 4 * 3600);
        REQUIRE(bars[1].open == 100.0);
        REQUIRE(bars[1].volume == 50.0);
    }

    SECTION("Buckets align on local exchange time") {
        // IST session opens 09:15 local, 03:45 UTC
        BarSynthesizer synth(4 * 3600, 19800);
        const int64_t open_utc = day + 3 * 3600 + 45 * 60;
        // 09:15 local falls in the 08:00-12:00 local bucket
        REQUIRE(synth.bucket_start(open_utc) == day + 8 * 3600 - 19800);
    }

    SECTION("Partial trailing bucket is kept") {
        BarSynthesizer synth(4 * 3600);
        Series hourly = {
            {day + 4 * 3600, 1.0, 2.0, 0.5, 1.5, 5.0},
        };
        auto bars = synth.aggregate(hourly);
        REQUIRE(bars.size() == 1);
        REQUIRE(bars[0].close == 1.5);
    }

    SECTION("Empty input") {
        BarSynthesizer synth(3600);
        REQUIRE(synth.aggregate(Series()).empty());
    }

    SECTION("Interval must be positive") {
        REQUIRE_THROWS_AS(BarSynthesizer(0), std::invalid_argument);
    }
}
