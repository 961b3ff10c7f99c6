#include "levels.hpp"
#include <algorithm>
#include <numeric>

LevelSet LevelDetector::detect(const Series& series, const LevelParams& params) {
    auto swings = detect_swings(series, params);

    LevelSet levels;
    levels.support = to_prices(swings.support);
    levels.resistance = to_prices(swings.resistance);
    return levels;
}

SwingLevels LevelDetector::detect_swings(const Series& series, const LevelParams& params) {
    SwingLevels swings;
    if (series.empty()) return swings;

    const size_t window = std::min(params.lookback_bars, series.size());
    const size_t offset = series.size() - window;

    std::vector<double> highs;
    std::vector<double> neg_lows;
    highs.reserve(window);
    neg_lows.reserve(window);
    for (size_t i = offset; i < series.size(); i++) {
        highs.push_back(series[i].high);
        neg_lows.push_back(-series[i].low);
    }

    auto keep_recent = [&](const std::vector<size_t>& peaks, bool lows) {
        std::vector<SwingPoint> points;
        size_t first = peaks.size() > params.max_levels ? peaks.size() - params.max_levels : 0;
        for (size_t i = first; i < peaks.size(); i++) {
            size_t idx = offset + peaks[i];
            points.push_back({idx, lows ? series[idx].low : series[idx].high});
        }
        return points;
    };

    swings.resistance = keep_recent(find_peaks(highs, params.min_separation, params.min_prominence), false);
    swings.support = keep_recent(find_peaks(neg_lows, params.min_separation, params.min_prominence), true);
    return swings;
}

std::vector<size_t> LevelDetector::find_peaks(const std::vector<double>& values,
                                              size_t min_separation,
                                              double min_prominence) {
    auto peaks = local_maxima(values);

    if (min_separation > 1 && peaks.size() > 1) {
        peaks = select_by_separation(peaks, values, min_separation);
    }

    std::vector<size_t> out;
    for (size_t p : peaks) {
        if (prominence(values, p) >= min_prominence) {
            out.push_back(p);
        }
    }
    return out;
}

std::vector<size_t> LevelDetector::local_maxima(const std::vector<double>& values) {
    std::vector<size_t> peaks;
    if (values.size() < 3) return peaks;

    const size_t last = values.size() - 1;
    size_t i = 1;
    while (i < last) {
        if (values[i - 1] < values[i]) {
            // Walk over a flat plateau
            size_t ahead = i + 1;
            while (ahead < last && values[ahead] == values[i]) {
                ahead++;
            }
            if (values[ahead] < values[i]) {
                size_t right_edge = ahead - 1;
                peaks.push_back((i + right_edge) / 2);
                i = ahead;
            }
        }
        i++;
    }
    return peaks;
}

std::vector<size_t> LevelDetector::select_by_separation(const std::vector<size_t>& peaks,
                                                        const std::vector<double>& values,
                                                        size_t min_separation) {
    const size_t n = peaks.size();
    std::vector<bool> keep(n, true);

    // Highest first; equal heights resolve to the more recent peak
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return values[peaks[a]] < values[peaks[b]];
    });

    for (size_t r = n; r-- > 0;) {
        size_t j = order[r];
        if (!keep[j]) continue;

        for (size_t k = j; k-- > 0 && peaks[j] - peaks[k] < min_separation;) {
            keep[k] = false;
        }
        for (size_t k = j + 1; k < n && peaks[k] - peaks[j] < min_separation; k++) {
            keep[k] = false;
        }
    }

    std::vector<size_t> out;
    for (size_t i = 0; i < n; i++) {
        if (keep[i]) out.push_back(peaks[i]);
    }
    return out;
}

double LevelDetector::prominence(const std::vector<double>& values, size_t peak) {
    const double height = values[peak];

    double left_min = height;
    for (size_t i = peak + 1; i-- > 0;) {
        if (values[i] > height) break;
        left_min = std::min(left_min, values[i]);
    }

    double right_min = height;
    for (size_t i = peak; i < values.size(); i++) {
        if (values[i] > height) break;
        right_min = std::min(right_min, values[i]);
    }

    return height - std::max(left_min, right_min);
}

std::vector<double> LevelDetector::to_prices(const std::vector<SwingPoint>& points) {
    std::vector<double> prices;
    prices.reserve(points.size());
    for (const auto& p : points) {
        prices.push_back(p.price);
    }
    std::sort(prices.begin(), prices.end());
    return prices;
}
