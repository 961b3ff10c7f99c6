#pragma once

#include "types.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Exchange session in local exchange time, minutes after midnight, inclusive
struct SessionWindow {
    int open_minute = 9 * 60 + 15;
    int close_minute = 15 * 60 + 30;
};

struct ChartData {
    std::string symbol;
    std::string exchange_tz;
    int64_t gmtoffset; // seconds east of UTC
    Series bars;

    size_t dropped_incomplete;
    size_t dropped_off_session;
};

class ChartNormalizer {
public:
    // Parses a v8 chart payload. Throws std::runtime_error when the payload
    // carries an API error or lacks the result/quote arrays.
    static ChartData normalize_chart(const nlohmann::json& raw,
                                     bool intraday,
                                     const SessionWindow& session = SessionWindow());

    static bool in_session(int64_t timestamp, int64_t gmtoffset, const SessionWindow& session);

private:
    static bool read_number(const nlohmann::json& arr, size_t i, double& out);
};
