#pragma once

#include "types.hpp"

// Defaults reproduce the documented 2x/4x ATR bracket, which always yields
// a ratio of exactly 2.0. Override the multipliers to make good_rr discriminate.
struct RiskParams {
    double stop_atr_mult = 2.0;
    double target_atr_mult = 4.0;
    double min_rr_ratio = 2.0;
};

class RiskCalculator {
public:
    static RiskLevels compute(double last_close, double atr, const RiskParams& params = RiskParams());
};
