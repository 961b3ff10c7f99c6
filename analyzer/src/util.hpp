#pragma once

#include <cstdint>
#include <string>
#include <chrono>
#include <optional>

namespace util {
    std::string current_iso8601();
    int64_t current_timestamp_ms();
    int64_t current_epoch_seconds();
    std::string trim(const std::string& str);
    std::string to_upper(const std::string& str);
    double round2(double value);

    // "HH:MM" -> minutes after midnight
    std::optional<int> parse_hhmm(const std::string& text);
}
