#include "normalize.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

bool ChartNormalizer::read_number(const nlohmann::json& arr, size_t i, double& out) {
    if (!arr.is_array() || i >= arr.size()) return false;

    const auto& v = arr[i];
    if (!v.is_number()) return false;

    out = v.get<double>();
    return std::isfinite(out);
}

bool ChartNormalizer::in_session(int64_t timestamp, int64_t gmtoffset, const SessionWindow& session) {
    const int64_t day = 86400;
    int64_t local = timestamp + gmtoffset;
    int64_t seconds_of_day = ((local % day) + day) % day;
    int minute = static_cast<int>(seconds_of_day / 60);
    return minute >= session.open_minute && minute <= session.close_minute;
}

ChartData ChartNormalizer::normalize_chart(const nlohmann::json& raw,
                                           bool intraday,
                                           const SessionWindow& session) {
    if (!raw.is_object() || !raw.contains("chart")) {
        throw std::runtime_error("Payload has no chart object");
    }

    const auto& chart = raw["chart"];
    if (chart.contains("error") && !chart["error"].is_null()) {
        const auto& err = chart["error"];
        std::string desc = err.is_object() ? err.value("description", "unknown error") : err.dump();
        throw std::runtime_error("Chart API error: " + desc);
    }
    if (!chart.contains("result") || !chart["result"].is_array() || chart["result"].empty()) {
        throw std::runtime_error("Chart payload has no result");
    }

    const auto& result = chart["result"][0];

    ChartData data;
    data.gmtoffset = 0;
    data.dropped_incomplete = 0;
    data.dropped_off_session = 0;

    if (result.contains("meta") && result["meta"].is_object()) {
        const auto& meta = result["meta"];
        data.symbol = meta.value("symbol", "");
        data.exchange_tz = meta.value("exchangeTimezoneName", "");
        if (meta.contains("gmtoffset") && meta["gmtoffset"].is_number()) {
            data.gmtoffset = meta["gmtoffset"].get<int64_t>();
        }
    }

    // No bars in the requested period
    if (!result.contains("timestamp") || !result["timestamp"].is_array()) {
        return data;
    }

    const auto& timestamps = result["timestamp"];
    if (!result.contains("indicators") || !result["indicators"].contains("quote") ||
        !result["indicators"]["quote"].is_array() || result["indicators"]["quote"].empty()) {
        throw std::runtime_error("Chart payload has no quote arrays");
    }
    const auto& quote = result["indicators"]["quote"][0];

    const nlohmann::json empty = nlohmann::json::array();
    const auto& opens = quote.contains("open") ? quote["open"] : empty;
    const auto& highs = quote.contains("high") ? quote["high"] : empty;
    const auto& lows = quote.contains("low") ? quote["low"] : empty;
    const auto& closes = quote.contains("close") ? quote["close"] : empty;
    const auto& volumes = quote.contains("volume") ? quote["volume"] : empty;

    data.bars.reserve(timestamps.size());
    for (size_t i = 0; i < timestamps.size(); i++) {
        if (!timestamps[i].is_number_integer()) {
            data.dropped_incomplete++;
            continue;
        }

        Bar bar;
        bar.timestamp = timestamps[i].get<int64_t>();
        if (!read_number(opens, i, bar.open) || !read_number(highs, i, bar.high) ||
            !read_number(lows, i, bar.low) || !read_number(closes, i, bar.close) ||
            !read_number(volumes, i, bar.volume)) {
            data.dropped_incomplete++;
            continue;
        }

        if (intraday && !in_session(bar.timestamp, data.gmtoffset, session)) {
            data.dropped_off_session++;
            continue;
        }

        data.bars.push_back(bar);
    }

    std::stable_sort(data.bars.begin(), data.bars.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });
    auto last = std::unique(data.bars.begin(), data.bars.end(),
                            [](const Bar& a, const Bar& b) { return a.timestamp == b.timestamp; });
    data.bars.erase(last, data.bars.end());

    spdlog::debug("Normalized {} bars for {} (incomplete={}, off_session={})",
                  data.bars.size(), data.symbol, data.dropped_incomplete, data.dropped_off_session);

    return data;
}
