#pragma once

#include <cstdint>
#include <string>
#include <vector>

// One OHLCV bar, timestamp in epoch seconds (UTC)
struct Bar {
    int64_t timestamp;
    double open;
    double high;
    double low;
    double close;
    double volume;
};

// Ascending by timestamp, no duplicates
using Series = std::vector<Bar>;

struct IndicatorSet {
    std::vector<double> ema; // aligned 1:1 with the series
    double atr;              // latest trailing value only
};

struct LevelSet {
    std::vector<double> support;    // ascending by price, max 3
    std::vector<double> resistance; // ascending by price, max 3
};

struct PatternFlags {
    bool uptrend;
    bool hh_hl;
    bool near_resistance;
    bool volume_spike;
    bool clear_levels;
};

struct RiskLevels {
    double stop_loss;
    double target;
    double rr_ratio;
    bool good_rr;
};

struct ChecklistItem {
    std::string id;
    std::string label;
    bool passed;
};

enum class Verdict {
    StrongBuy,
    Neutral,
    Avoid
};

struct AnalysisResult {
    std::vector<ChecklistItem> signals; // display order
    int passing;
    Verdict verdict;

    double stop_loss;
    double target;
    double rr_ratio;
    double atr;

    LevelSet levels;
    double last_close;
    double ema_last;
};
