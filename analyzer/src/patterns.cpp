#include "patterns.hpp"
#include "errors.hpp"
#include <limits>
#include <string>

PatternFlags PatternEvaluator::evaluate(const Series& series,
                                        const IndicatorSet& indicators,
                                        const LevelSet& levels,
                                        const PatternParams& params) {
    if (series.size() < params.volume_lookback + 1 || series.size() < 3) {
        throw AnalysisError(FailureKind::ComputationError,
                            "Pattern evaluation needs " +
                            std::to_string(params.volume_lookback + 1) + " bars");
    }

    PatternFlags flags;
    flags.uptrend = is_uptrend(series, indicators.ema);
    flags.hh_hl = is_hh_hl(series);
    flags.near_resistance = is_near_resistance(series.back().close, levels.resistance,
                                               params.near_resistance_pct);
    flags.volume_spike = is_volume_spike(series, params.volume_spike_mult, params.volume_lookback);

    // Placeholder: satisfied whenever level detection ran
    flags.clear_levels = true;

    return flags;
}

bool PatternEvaluator::is_uptrend(const Series& series, const std::vector<double>& ema) {
    if (series.empty() || ema.size() != series.size()) {
        throw AnalysisError(FailureKind::ComputationError, "EMA not aligned with series");
    }
    return series.back().close > ema.back();
}

bool PatternEvaluator::is_hh_hl(const Series& series) {
    if (series.size() < 3) return false;

    const auto& b3 = series[series.size() - 3];
    const auto& b2 = series[series.size() - 2];
    const auto& b1 = series[series.size() - 1];

    bool hh = b1.high > b2.high && b2.high > b3.high;
    bool hl = b1.low > b2.low && b2.low > b3.low;
    return hh && hl;
}

bool PatternEvaluator::is_near_resistance(double last_close,
                                          const std::vector<double>& resistance,
                                          double tolerance_pct) {
    // Nearest level strictly above the close
    double nearest = std::numeric_limits<double>::infinity();
    for (double level : resistance) {
        if (level > last_close && level < nearest) {
            nearest = level;
        }
    }

    if (nearest == std::numeric_limits<double>::infinity()) return false;

    return last_close >= nearest * (1.0 - tolerance_pct / 100.0);
}

bool PatternEvaluator::is_volume_spike(const Series& series, double mult, size_t lookback) {
    if (lookback == 0 || series.size() < lookback + 1) return false;

    double sum = 0.0;
    for (size_t i = series.size() - 1 - lookback; i < series.size() - 1; i++) {
        sum += series[i].volume;
    }
    const double mean = sum / static_cast<double>(lookback);

    return series.back().volume > mean * mult;
}
