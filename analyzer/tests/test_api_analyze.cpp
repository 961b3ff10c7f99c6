#include <catch2/catch_test_macros.hpp>
#include "../src/api_analyze.hpp"
#include "test_helpers.hpp"

using testdata::FakeSource;

namespace {

struct Fixture {
    std::shared_ptr<FakeSource> source;
    std::shared_ptr<AnalysisCache> cache = std::make_shared<AnalysisCache>(300);
    std::shared_ptr<HealthMonitor> health = std::make_shared<HealthMonitor>();
    std::unique_ptr<AnalyzeHandler> handler;

    explicit Fixture(std::shared_ptr<FakeSource> src) : source(std::move(src)) {
        handler = std::make_unique<AnalyzeHandler>(std::make_shared<Analyzer>(source), cache, health);
    }
};

}

TEST_CASE("Analyze request validation", "[api]") {
    Fixture f(std::make_shared<FakeSource>(testdata::rising_series()));

    SECTION("Symbol is required") {
        auto reply = f.handler->analyze("   ", "1d");
        REQUIRE(reply.status == 400);
        REQUIRE(reply.body["ok"] == false);
        REQUIRE(f.source->calls == 0);
    }

    SECTION("Unknown timeframe") {
        REQUIRE(f.handler->analyze("TCS.NS", "2h").status == 400);
    }

    SECTION("Timeframe defaults to daily") {
        auto reply = f.handler->analyze("TCS.NS", "");
        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["timeframe"] == "1d");
    }
}

TEST_CASE("Analyze caching", "[api]") {
    Fixture f(std::make_shared<FakeSource>(testdata::rising_series()));

    auto first = f.handler->analyze("tcs.ns", "1d");
    REQUIRE(first.status == 200);
    REQUIRE(first.body["ok"] == true);
    REQUIRE(first.body["cached"] == false);

    SECTION("Repeat request is served from cache") {
        auto second = f.handler->analyze("TCS.NS", "1D");
        REQUIRE(second.body["cached"] == true);
        REQUIRE(f.source->calls == 1);
        REQUIRE(f.health->to_json()["cache_hits"] == 1);
    }

    SECTION("fresh bypasses the cache") {
        auto again = f.handler->analyze("TCS.NS", "1d", true);
        REQUIRE(again.body["cached"] == false);
        REQUIRE(f.source->calls == 2);
    }

    SECTION("Invalidate then refetch") {
        auto reply = f.handler->invalidate("TCS.NS", "1d");
        REQUIRE(reply.body["removed"] == 1);
        f.handler->analyze("TCS.NS", "1d");
        REQUIRE(f.source->calls == 2);
    }

    SECTION("Invalidate scopes") {
        f.handler->analyze("TCS.NS", "1h");
        f.handler->analyze("INFY.NS", "1d");
        REQUIRE(f.handler->invalidate("", "1d").status == 400);
        REQUIRE(f.handler->invalidate("tcs.ns", "").body["removed"] == 2);
        REQUIRE(f.handler->invalidate("", "").body["removed"] == 1);
    }
}

TEST_CASE("Analyze failure", "[api]") {
    Fixture f(std::make_shared<FakeSource>());

    auto reply = f.handler->analyze("DOWN.NS", "1d");
    REQUIRE(reply.status == 200);
    REQUIRE(reply.body["ok"] == false);
    REQUIRE(reply.body["error"] == "analysis unavailable");
    REQUIRE(f.cache->size() == 0);
    REQUIRE(f.health->to_json()["no_results"]["data_unavailable"] == 1);
}

TEST_CASE("Command bus request", "[api]") {
    Fixture f(std::make_shared<FakeSource>(testdata::rising_series()));

    nlohmann::json req = {
        {"cmd", "analyze"},
        {"corr_id", "abc-1"},
        {"args", {{"symbol", "TCS.NS"}, {"timeframe", "1wk"}}}
    };
    auto reply = f.handler->handle_command(req);

    REQUIRE(reply["type"] == "reply");
    REQUIRE(reply["cmd"] == "analyze");
    REQUIRE(reply["corr_id"] == "abc-1");
    REQUIRE(reply["status"] == 200);
    REQUIRE(reply["result"]["timeframe"] == "1wk");

    SECTION("Missing args is a bad request") {
        auto bad = f.handler->handle_command({{"cmd", "analyze"}, {"corr_id", "abc-2"}});
        REQUIRE(bad["status"] == 400);
    }

    SECTION("Mistyped fresh flag still gets a reply") {
        nlohmann::json mistyped = {
            {"cmd", "analyze"},
            {"corr_id", "abc-3"},
            {"args", {{"symbol", "TCS.NS"}, {"timeframe", "1d"}, {"fresh", "1"}}}
        };
        nlohmann::json bad;
        REQUIRE_NOTHROW(bad = f.handler->handle_command(mistyped));
        REQUIRE(bad["type"] == "reply");
        REQUIRE(bad["corr_id"] == "abc-3");
        REQUIRE(bad["status"] == 400);
        REQUIRE(bad["result"]["ok"] == false);
    }

    SECTION("Numeric symbol still gets a reply") {
        nlohmann::json mistyped = {
            {"cmd", "analyze"},
            {"corr_id", "abc-4"},
            {"args", {{"symbol", 123}, {"timeframe", "1d"}}}
        };
        nlohmann::json bad;
        REQUIRE_NOTHROW(bad = f.handler->handle_command(mistyped));
        REQUIRE(bad["corr_id"] == "abc-4");
        REQUIRE(bad["status"] == 400);
    }
}
