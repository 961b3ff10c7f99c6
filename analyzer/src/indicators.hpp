#pragma once

#include "types.hpp"
#include <cstddef>
#include <vector>

struct IndicatorParams {
    size_t ema_window = 50;
    size_t atr_window = 14;
};

class IndicatorEngine {
public:
    static IndicatorSet compute(const Series& series, const IndicatorParams& params = IndicatorParams());

    // alpha = 2/(window+1), seeded with the first close
    static std::vector<double> compute_ema(const Series& series, size_t window = 50);

    static std::vector<double> true_range(const Series& series);

    // Simple trailing mean of the last `window` true ranges
    static double compute_atr(const Series& series, size_t window = 14);
};
