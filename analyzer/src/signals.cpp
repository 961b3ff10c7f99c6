#include "signals.hpp"

std::vector<ChecklistItem> SignalAggregator::build_checklist(const PatternFlags& patterns,
                                                             const RiskLevels& risk) {
    return {
        {"uptrend",         "In uptrend",      patterns.uptrend},
        {"hh_hl",           "HH/HL pattern",   patterns.hh_hl},
        {"near_resistance", "Near resistance", patterns.near_resistance},
        {"volume_spike",    "Volume spike",    patterns.volume_spike},
        {"clear_levels",    "Clear levels",    patterns.clear_levels},
        {"good_rr",         "Good R/R ratio",  risk.good_rr},
    };
}

int SignalAggregator::count_passing(const std::vector<ChecklistItem>& checklist) {
    int passing = 0;
    for (const auto& item : checklist) {
        if (item.passed) passing++;
    }
    return passing;
}

Verdict SignalAggregator::classify(int passing) {
    if (passing >= kStrongThreshold) return Verdict::StrongBuy;
    if (passing >= kNeutralThreshold) return Verdict::Neutral;
    return Verdict::Avoid;
}

std::string SignalAggregator::verdict_id(Verdict verdict) {
    switch (verdict) {
        case Verdict::StrongBuy: return "strong_buy";
        case Verdict::Neutral:   return "neutral";
        case Verdict::Avoid:     return "avoid";
    }
    return "avoid";
}

std::string SignalAggregator::verdict_label(Verdict verdict) {
    switch (verdict) {
        case Verdict::StrongBuy: return "STRONG BUY SIGNAL";
        case Verdict::Neutral:   return "NEUTRAL SIGNAL";
        case Verdict::Avoid:     return "AVOID TRADE";
    }
    return "AVOID TRADE";
}

std::string SignalAggregator::summary(const std::vector<ChecklistItem>& checklist) {
    return std::to_string(count_passing(checklist)) + "/" +
           std::to_string(checklist.size()) + " criteria met";
}
