#pragma once

#include <string>
#include <optional>
#include <vector>

enum class Timeframe {
    M5,
    M15,
    H1,
    H4,
    D1,
    W1,
    MN1
};

struct TimeframeSpec {
    Timeframe tf;
    const char* name;          // request name, e.g. "1d"
    const char* fetch_interval; // upstream chart interval
    int lookback_days;
    bool intraday;             // session window filtering applies
    int aggregate_factor;      // upstream bars per output bar
};

const TimeframeSpec& timeframe_spec(Timeframe tf);
std::string to_string(Timeframe tf);
std::optional<Timeframe> parse_timeframe(const std::string& name);
const std::vector<Timeframe>& all_timeframes();
