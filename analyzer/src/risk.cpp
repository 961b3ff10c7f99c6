#include "risk.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

RiskLevels RiskCalculator::compute(double last_close, double atr, const RiskParams& params) {
    if (!std::isfinite(last_close) || !std::isfinite(atr)) {
        throw AnalysisError(FailureKind::ComputationError, "Non-finite close or ATR");
    }
    if (atr <= 0.0) {
        throw AnalysisError(FailureKind::ComputationError,
                            "ATR is " + std::to_string(atr) + ", stop-loss equals last close");
    }

    const double risk = params.stop_atr_mult * atr;
    const double reward = params.target_atr_mult * atr;

    RiskLevels levels;
    levels.stop_loss = last_close - risk;
    levels.target = last_close + reward;

    if (risk <= 0.0 || levels.stop_loss == last_close) {
        throw AnalysisError(FailureKind::ComputationError, "Zero risk distance");
    }

    // (target - close) / (close - stop), taken on the ATR distances so the
    // default multipliers give exactly 2.0
    levels.rr_ratio = reward / risk;
    levels.good_rr = levels.rr_ratio >= params.min_rr_ratio;

    return levels;
}
