#include <catch2/catch_test_macros.hpp>
#include "../src/timeframe.hpp"

TEST_CASE("Timeframe parsing", "[timeframe]") {
    SECTION("Request names round-trip") {
        for (auto tf : all_timeframes()) {
            auto parsed = parse_timeframe(to_string(tf));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == tf);
        }
    }

    SECTION("Case-insensitive, 60m is an alias for 1h") {
        REQUIRE(parse_timeframe("1D") == Timeframe::D1);
        REQUIRE(parse_timeframe("60m") == Timeframe::H1);
        REQUIRE(parse_timeframe("1WK") == Timeframe::W1);
    }

    SECTION("Unknown names are rejected") {
        REQUIRE_FALSE(parse_timeframe("2h").has_value());
        REQUIRE_FALSE(parse_timeframe("").has_value());
    }
}

TEST_CASE("Timeframe fetch table", "[timeframe]") {
    SECTION("4h is built from 1h bars") {
        const auto& spec = timeframe_spec(Timeframe::H4);
        REQUIRE(std::string(spec.fetch_interval) == "60m");
        REQUIRE(spec.aggregate_factor == 4);
        REQUIRE(spec.lookback_days == 60);
        REQUIRE(spec.intraday);
    }

    SECTION("Daily and above skip the session filter") {
        REQUIRE_FALSE(timeframe_spec(Timeframe::D1).intraday);
        REQUIRE_FALSE(timeframe_spec(Timeframe::W1).intraday);
        REQUIRE_FALSE(timeframe_spec(Timeframe::MN1).intraday);
        REQUIRE(timeframe_spec(Timeframe::D1).lookback_days == 90);
        REQUIRE(timeframe_spec(Timeframe::MN1).lookback_days == 730);
    }

    SECTION("Intraday lookbacks") {
        REQUIRE(timeframe_spec(Timeframe::M5).lookback_days == 7);
        REQUIRE(timeframe_spec(Timeframe::M15).lookback_days == 15);
        REQUIRE(timeframe_spec(Timeframe::H1).lookback_days == 30);
    }
}
