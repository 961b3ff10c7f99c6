#include <catch2/catch_test_macros.hpp>
#include "../src/levels.hpp"
#include "test_helpers.hpp"

namespace {

// Highs at 100 with spikes at 5, 11, 17, 23; lows flat
Series spiked_series() {
    Series s;
    for (int i = 0; i < 30; i++) {
        s.push_back({testdata::kDay + i * 86400, 95.0, 100.0, 90.0, 95.0, 1000.0});
    }
    s[5].high = 110.0;
    s[11].high = 120.0;
    s[17].high = 105.0;
    s[23].high = 115.0;
    return s;
}

}

TEST_CASE("Peak finding", "[levels]") {
    SECTION("Strict local maxima, endpoints excluded") {
        std::vector<double> v = {0, 5, 0, 0, 3, 0, 0, 0, 4, 0};
        REQUIRE(LevelDetector::find_peaks(v, 1, 1.0) == std::vector<size_t>{1, 4, 8});

        std::vector<double> edge = {5, 0, 0, 7};
        REQUIRE(LevelDetector::find_peaks(edge, 1, 0.0).empty());
    }

    SECTION("Flat plateau resolves to its midpoint") {
        std::vector<double> v = {0, 2, 2, 2, 0};
        REQUIRE(LevelDetector::find_peaks(v, 1, 1.0) == std::vector<size_t>{2});
    }

    SECTION("Separation keeps the taller peak") {
        std::vector<double> v = {0, 5, 0, 4, 0, 0, 0, 0, 0, 3, 0};
        REQUIRE(LevelDetector::find_peaks(v, 5, 1.0) == std::vector<size_t>{1, 9});
    }

    SECTION("Equal heights inside the separation keep the more recent peak") {
        std::vector<double> v = {0, 4, 0, 4, 0};
        REQUIRE(LevelDetector::find_peaks(v, 5, 1.0) == std::vector<size_t>{3});
    }

    SECTION("Prominence threshold is inclusive") {
        std::vector<double> v = {0, 2, 1.5, 3, 0};
        REQUIRE(LevelDetector::find_peaks(v, 1, 1.0) == std::vector<size_t>{3});
        REQUIRE(LevelDetector::find_peaks(v, 1, 0.5) == std::vector<size_t>{1, 3});
    }

    SECTION("Flat input has no peaks") {
        std::vector<double> v(20, 100.0);
        REQUIRE(LevelDetector::find_peaks(v, 5, 0.0).empty());
    }
}

TEST_CASE("Support and resistance detection", "[levels]") {
    SECTION("Three most recent swing highs, ascending by price") {
        auto levels = LevelDetector::detect(spiked_series());
        REQUIRE(levels.resistance == std::vector<double>{105.0, 115.0, 120.0});
        REQUIRE(levels.support.empty());
    }

    SECTION("Swing indices respect the minimum separation") {
        LevelParams params;
        auto swings = LevelDetector::detect_swings(spiked_series(), params);
        REQUIRE(swings.resistance.size() == 3);
        REQUIRE(swings.resistance[0].index == 11);
        REQUIRE(swings.resistance[1].index == 17);
        REQUIRE(swings.resistance[2].index == 23);
        for (size_t i = 1; i < swings.resistance.size(); i++) {
            REQUIRE(swings.resistance[i].index - swings.resistance[i - 1].index >= params.min_separation);
        }
    }

    SECTION("Only the lookback window is searched") {
        LevelParams params;
        params.lookback_bars = 10;
        auto levels = LevelDetector::detect(spiked_series(), params);
        REQUIRE(levels.resistance == std::vector<double>{115.0});
    }

    SECTION("Swing lows become support") {
        auto s = spiked_series();
        s[8].low = 80.0;
        s[20].low = 85.0;
        auto levels = LevelDetector::detect(s);
        REQUIRE(levels.support == std::vector<double>{80.0, 85.0});
    }

    SECTION("Flat series yields no levels") {
        auto levels = LevelDetector::detect(testdata::flat_series(60));
        REQUIRE(levels.support.empty());
        REQUIRE(levels.resistance.empty());
    }

    SECTION("Empty series yields no levels") {
        auto levels = LevelDetector::detect(Series());
        REQUIRE(levels.support.empty());
        REQUIRE(levels.resistance.empty());
    }
}
