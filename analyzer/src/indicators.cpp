#include "indicators.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

IndicatorSet IndicatorEngine::compute(const Series& series, const IndicatorParams& params) {
    IndicatorSet set;
    set.ema = compute_ema(series, params.ema_window);
    set.atr = compute_atr(series, params.atr_window);
    return set;
}

std::vector<double> IndicatorEngine::compute_ema(const Series& series, size_t window) {
    if (window == 0) {
        throw AnalysisError(FailureKind::ComputationError, "EMA window must be positive");
    }

    std::vector<double> ema;
    if (series.empty()) return ema;

    ema.reserve(series.size());
    const double k = 2.0 / (static_cast<double>(window) + 1.0);

    double e = series.front().close;
    ema.push_back(e);
    for (size_t i = 1; i < series.size(); i++) {
        e = series[i].close * k + e * (1.0 - k);
        ema.push_back(e);
    }
    return ema;
}

std::vector<double> IndicatorEngine::true_range(const Series& series) {
    std::vector<double> tr;
    tr.reserve(series.size());

    for (size_t i = 0; i < series.size(); i++) {
        const auto& bar = series[i];
        double range = bar.high - bar.low;

        // No previous close for the first bar
        if (i > 0) {
            const double prev_close = series[i - 1].close;
            range = std::max({range,
                              std::abs(bar.high - prev_close),
                              std::abs(bar.low - prev_close)});
        }
        tr.push_back(range);
    }
    return tr;
}

double IndicatorEngine::compute_atr(const Series& series, size_t window) {
    if (window == 0) {
        throw AnalysisError(FailureKind::ComputationError, "ATR window must be positive");
    }
    if (series.size() < window) {
        throw AnalysisError(FailureKind::ComputationError,
                            "ATR(" + std::to_string(window) + ") undefined for " +
                            std::to_string(series.size()) + " bars");
    }

    auto tr = true_range(series);

    double sum = 0.0;
    for (size_t i = tr.size() - window; i < tr.size(); i++) {
        sum += tr[i];
    }
    return sum / static_cast<double>(window);
}
