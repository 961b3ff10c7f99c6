#include "market_data.hpp"
#include "bar_synth.hpp"
#include "util.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>

FetchResult FetchResult::success(Series series) {
    FetchResult r;
    r.series = std::move(series);
    return r;
}

FetchResult FetchResult::unavailable(std::string reason) {
    FetchResult r;
    r.error = std::move(reason);
    return r;
}

ChartApiSource::ChartApiSource(const std::string& base_url,
                               std::shared_ptr<HttpClient> http,
                               SessionWindow session)
    : base_url_(base_url), http_(std::move(http)), session_(session) {}

std::string ChartApiSource::build_url(const std::string& symbol, const TimeframeSpec& spec,
                                      int64_t now_s) const {
    // Index tickers such as ^NSEI need escaping
    std::string encoded = symbol;
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (curl) {
        if (char* escaped = curl_easy_escape(curl.get(), symbol.c_str(), static_cast<int>(symbol.size()))) {
            encoded = escaped;
            curl_free(escaped);
        }
    }

    int64_t period1 = now_s - static_cast<int64_t>(spec.lookback_days) * 86400;
    return base_url_ + "/" + encoded +
           "?period1=" + std::to_string(period1) +
           "&period2=" + std::to_string(now_s) +
           "&interval=" + spec.fetch_interval +
           "&includePrePost=false";
}

FetchResult ChartApiSource::fetch(const std::string& symbol, Timeframe tf, const CancelCheck& cancel) {
    if (symbol.empty()) {
        return FetchResult::unavailable("empty symbol");
    }

    const auto& spec = timeframe_spec(tf);

    try {
        std::string url = build_url(symbol, spec, util::current_epoch_seconds());

        auto start_ms = util::current_timestamp_ms();
        auto response = http_->get_json(url, cancel);
        spdlog::debug("Fetched {} {} in {} ms", symbol, spec.name, util::current_timestamp_ms() - start_ms);

        if (!response.has_value()) {
            return FetchResult::unavailable("request failed for " + symbol + " " + spec.name);
        }

        auto chart = ChartNormalizer::normalize_chart(*response, spec.intraday, session_);

        Series series = std::move(chart.bars);
        if (spec.aggregate_factor > 1 && !series.empty()) {
            // Upstream interval is 1h for every aggregated timeframe
            BarSynthesizer synth(3600 * spec.aggregate_factor, chart.gmtoffset);
            series = synth.aggregate(series);
        }

        if (series.empty()) {
            return FetchResult::unavailable("no bars for " + symbol + " " + spec.name);
        }
        return FetchResult::success(std::move(series));

    } catch (const std::exception& e) {
        spdlog::warn("Fetch failed for {} {}: {}", symbol, spec.name, e.what());
        return FetchResult::unavailable(e.what());
    }
}
