#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/indicators.hpp"
#include "../src/errors.hpp"
#include "test_helpers.hpp"

using Catch::Approx;

TEST_CASE("EMA", "[indicators]") {
    SECTION("Constant closes give a constant EMA") {
        Series s;
        for (int i = 0; i < 30; i++) {
            s.push_back({i, 10.0, 11.0, 9.0, 10.0, 1.0});
        }
        auto ema = IndicatorEngine::compute_ema(s, 50);
        REQUIRE(ema.size() == s.size());
        for (double v : ema) {
            REQUIRE(v == Approx(10.0));
        }
    }

    SECTION("Seeded with the first close, alpha = 2/(w+1)") {
        Series s = {
            {0, 1.0, 1.0, 1.0, 1.0, 1.0},
            {1, 2.0, 2.0, 2.0, 2.0, 1.0},
            {2, 3.0, 3.0, 3.0, 3.0, 1.0},
        };
        auto ema = IndicatorEngine::compute_ema(s, 3);
        REQUIRE(ema[0] == Approx(1.0));
        REQUIRE(ema[1] == Approx(1.5));
        REQUIRE(ema[2] == Approx(2.25));
    }

    SECTION("Zero window is a computation error") {
        auto s = testdata::rising_series();
        try {
            IndicatorEngine::compute_ema(s, 0);
            FAIL("expected AnalysisError");
        } catch (const AnalysisError& e) {
            REQUIRE(e.kind() == FailureKind::ComputationError);
        }
    }
}

TEST_CASE("True range and ATR", "[indicators]") {
    SECTION("First bar uses high - low only") {
        Series s = {
            {0, 9.0, 10.0, 8.0, 9.0, 1.0},
            {1, 13.0, 15.0, 12.0, 14.0, 1.0},
        };
        auto tr = IndicatorEngine::true_range(s);
        REQUIRE(tr[0] == Approx(2.0));
        // Gap up: |high - prev close| dominates
        REQUIRE(tr[1] == Approx(6.0));
    }

    SECTION("Constant range gives ATR equal to that range") {
        auto s = testdata::rising_series();
        REQUIRE(IndicatorEngine::compute_atr(s, 14) == Approx(2.0));
    }

    SECTION("ATR averages only the trailing window") {
        auto s = testdata::flat_series(20);
        s.back().high = 114.0; // TR of the last bar becomes 14
        REQUIRE(IndicatorEngine::compute_atr(s, 14) == Approx(1.0));
    }

    SECTION("Flat series has zero ATR") {
        REQUIRE(IndicatorEngine::compute_atr(testdata::flat_series(), 14) == 0.0);
    }

    SECTION("Series shorter than the window is rejected") {
        auto s = testdata::rising_series(10);
        REQUIRE_THROWS_AS(IndicatorEngine::compute_atr(s, 14), AnalysisError);
    }

    SECTION("compute fills both indicators") {
        auto s = testdata::rising_series();
        auto set = IndicatorEngine::compute(s);
        REQUIRE(set.ema.size() == s.size());
        REQUIRE(set.atr == Approx(2.0));
    }
}
