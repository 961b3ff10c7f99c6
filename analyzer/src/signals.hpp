#pragma once

#include "types.hpp"
#include <string>
#include <vector>

class SignalAggregator {
public:
    static constexpr int kStrongThreshold = 5;
    static constexpr int kNeutralThreshold = 3;

    static std::vector<ChecklistItem> build_checklist(const PatternFlags& patterns,
                                                      const RiskLevels& risk);

    static int count_passing(const std::vector<ChecklistItem>& checklist);
    static Verdict classify(int passing);

    static std::string verdict_id(Verdict verdict);
    static std::string verdict_label(Verdict verdict);

    // "4/6 criteria met"
    static std::string summary(const std::vector<ChecklistItem>& checklist);
};
