#pragma once

#include "analyzer.hpp"
#include <nlohmann/json.hpp>

class ReportFormatter {
public:
    // Full response for the presentation layer, chart data included
    static nlohmann::json to_json(const AnalysisReport& report, bool cached = false);

    // Uniform failure body; the cause is only logged
    static nlohmann::json no_result_json();

    static nlohmann::json levels_json(const LevelSet& levels);
    static nlohmann::json chart_json(const Series& series, const std::vector<double>& ema);
};
