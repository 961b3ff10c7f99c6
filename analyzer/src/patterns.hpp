#pragma once

#include "types.hpp"
#include <cstddef>
#include <vector>

struct PatternParams {
    double near_resistance_pct = 2.0; // close within this % below the level
    double volume_spike_mult = 1.5;
    size_t volume_lookback = 9;       // bars averaged before the latest one
};

class PatternEvaluator {
public:
    static PatternFlags evaluate(const Series& series,
                                 const IndicatorSet& indicators,
                                 const LevelSet& levels,
                                 const PatternParams& params = PatternParams());

    // Latest close above latest EMA
    static bool is_uptrend(const Series& series, const std::vector<double>& ema);

    // Last 3 bars: strictly rising highs and strictly rising lows
    static bool is_hh_hl(const Series& series);

    static bool is_near_resistance(double last_close,
                                   const std::vector<double>& resistance,
                                   double tolerance_pct = 2.0);

    static bool is_volume_spike(const Series& series, double mult = 1.5, size_t lookback = 9);
};
