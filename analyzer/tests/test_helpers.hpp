#pragma once

#include "../src/market_data.hpp"
#include "../src/http_client.hpp"
#include "../src/types.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace testdata {

const int64_t kDay = 1699920000; // 2023-11-14 00:00 UTC

// Close 100..124, highs and lows stepping up with the close, last volume 3x
inline Series rising_series(size_t n = 25) {
    Series s;
    for (size_t i = 0; i < n; i++) {
        double c = 100.0 + static_cast<double>(i);
        s.push_back({kDay + static_cast<int64_t>(i) * 86400, c - 0.5, c + 1.0, c - 1.0, c, 1000.0});
    }
    if (!s.empty()) s.back().volume = 3000.0;
    return s;
}

inline Series flat_series(size_t n = 25, double price = 100.0) {
    Series s;
    for (size_t i = 0; i < n; i++) {
        s.push_back({kDay + static_cast<int64_t>(i) * 86400, price, price, price, price, 1000.0});
    }
    return s;
}

// v8 chart payload with one result and one quote block
inline nlohmann::json chart_payload(const nlohmann::json& timestamps, const nlohmann::json& quote,
                                    int64_t gmtoffset = 19800) {
    using nlohmann::json;
    return {
        {"chart", {
            {"result", json::array({
                {
                    {"meta", {{"symbol", "RELIANCE.NS"}, {"exchangeTimezoneName", "Asia/Kolkata"}, {"gmtoffset", gmtoffset}}},
                    {"timestamp", timestamps},
                    {"indicators", {{"quote", json::array({quote})}}}
                }
            })},
            {"error", nullptr}
        }}
    };
}

// Bar i: open 100+i, high +2, low -2, close +1, volume 1000+i
inline nlohmann::json quote_of(size_t n) {
    using nlohmann::json;
    json q = {{"open", json::array()}, {"high", json::array()}, {"low", json::array()},
              {"close", json::array()}, {"volume", json::array()}};
    for (size_t i = 0; i < n; i++) {
        double base = 100.0 + static_cast<double>(i);
        q["open"].push_back(base);
        q["high"].push_back(base + 2.0);
        q["low"].push_back(base - 2.0);
        q["close"].push_back(base + 1.0);
        q["volume"].push_back(1000 + i);
    }
    return q;
}

// Serves one canned payload for every URL
class CannedHttpClient : public HttpClient {
public:
    explicit CannedHttpClient(nlohmann::json payload) : payload_(std::move(payload)) {}

    std::optional<nlohmann::json> get_json(const std::string& url, const CancelCheck&) const override {
        last_url = url;
        return payload_;
    }

    mutable std::string last_url;

private:
    nlohmann::json payload_;
};

class ThrowingSource : public MarketDataSource {
public:
    FetchResult fetch(const std::string&, Timeframe, const CancelCheck&) override {
        throw std::runtime_error("connection pool exhausted");
    }
};

class FakeSource : public MarketDataSource {
public:
    explicit FakeSource(Series series) : series_(std::move(series)) {}
    FakeSource() : fail_(true) {}

    FetchResult fetch(const std::string& symbol, Timeframe, const CancelCheck&) override {
        calls++;
        last_symbol = symbol;
        if (fail_) return FetchResult::unavailable("upstream down");
        return FetchResult::success(series_);
    }

    int calls = 0;
    std::string last_symbol;

private:
    Series series_;
    bool fail_ = false;
};

}
