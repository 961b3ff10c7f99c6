#pragma once

#include "types.hpp"
#include <cstddef>
#include <vector>

struct LevelParams {
    size_t lookback_bars = 50;
    size_t min_separation = 5;  // bars between same-side levels
    double min_prominence = 1.0; // price units
    size_t max_levels = 3;
};

struct SwingPoint {
    size_t index; // index into the full series
    double price;
};

struct SwingLevels {
    std::vector<SwingPoint> support;    // ascending by index
    std::vector<SwingPoint> resistance; // ascending by index
};

class LevelDetector {
public:
    static LevelSet detect(const Series& series, const LevelParams& params = LevelParams());

    // Most recent qualifying swing lows/highs inside the lookback window
    static SwingLevels detect_swings(const Series& series, const LevelParams& params);

    // Peak indices of `values` filtered by separation and prominence, ascending
    static std::vector<size_t> find_peaks(const std::vector<double>& values,
                                          size_t min_separation,
                                          double min_prominence);

private:
    static std::vector<size_t> local_maxima(const std::vector<double>& values);
    static std::vector<size_t> select_by_separation(const std::vector<size_t>& peaks,
                                                    const std::vector<double>& values,
                                                    size_t min_separation);
    static double prominence(const std::vector<double>& values, size_t peak);
    static std::vector<double> to_prices(const std::vector<SwingPoint>& points);
};
