#include "timeframe.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

// 4h has no native upstream interval, it is built from 1h bars
const TimeframeSpec kSpecs[] = {
    {Timeframe::M5,  "5m",  "5m",  7,   true,  1},
    {Timeframe::M15, "15m", "15m", 15,  true,  1},
    {Timeframe::H1,  "1h",  "60m", 30,  true,  1},
    {Timeframe::H4,  "4h",  "60m", 60,  true,  4},
    {Timeframe::D1,  "1d",  "1d",  90,  false, 1},
    {Timeframe::W1,  "1wk", "1wk", 365, false, 1},
    {Timeframe::MN1, "1mo", "1mo", 730, false, 1},
};

}

const TimeframeSpec& timeframe_spec(Timeframe tf) {
    for (const auto& spec : kSpecs) {
        if (spec.tf == tf) return spec;
    }
    throw std::invalid_argument("Unknown timeframe");
}

std::string to_string(Timeframe tf) {
    return timeframe_spec(tf).name;
}

std::optional<Timeframe> parse_timeframe(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "60m") return Timeframe::H1;

    for (const auto& spec : kSpecs) {
        if (key == spec.name) return spec.tf;
    }
    return std::nullopt;
}

const std::vector<Timeframe>& all_timeframes() {
    static const std::vector<Timeframe> all = {
        Timeframe::M5, Timeframe::M15, Timeframe::H1, Timeframe::H4,
        Timeframe::D1, Timeframe::W1, Timeframe::MN1
    };
    return all;
}
