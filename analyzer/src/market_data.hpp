#pragma once

#include "types.hpp"
#include "timeframe.hpp"
#include "normalize.hpp"
#include "http_client.hpp"
#include <memory>
#include <optional>
#include <string>

struct FetchResult {
    Series series;
    std::optional<std::string> error; // set => DataUnavailable

    bool ok() const { return !error.has_value(); }

    static FetchResult success(Series series);
    static FetchResult unavailable(std::string reason);
};

class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    // Never throws; every failure comes back as FetchResult::unavailable
    virtual FetchResult fetch(const std::string& symbol, Timeframe tf,
                              const CancelCheck& cancel = nullptr) = 0;
};

// Yahoo-style v8 chart endpoint
class ChartApiSource : public MarketDataSource {
public:
    ChartApiSource(const std::string& base_url,
                   std::shared_ptr<HttpClient> http,
                   SessionWindow session = SessionWindow());

    FetchResult fetch(const std::string& symbol, Timeframe tf,
                      const CancelCheck& cancel = nullptr) override;

    std::string build_url(const std::string& symbol, const TimeframeSpec& spec, int64_t now_s) const;

private:
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
    SessionWindow session_;
};
