#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "timeframe.hpp"
#include "market_data.hpp"
#include "indicators.hpp"
#include "levels.hpp"
#include "patterns.hpp"
#include "risk.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct AnalyzerSettings {
    IndicatorParams indicators;
    LevelParams levels;
    PatternParams patterns;
    RiskParams risk;
    size_t min_bars = 20;
};

// Response payload: the result plus what a chart needs
struct AnalysisReport {
    std::string symbol;
    Timeframe timeframe;
    AnalysisResult result;
    Series series;
    std::vector<double> ema;
    std::string generated_at;
};

struct AnalysisOutcome {
    std::optional<AnalysisReport> report;
    std::optional<NoResult> no_result;

    bool ok() const { return report.has_value(); }

    static AnalysisOutcome success(AnalysisReport report);
    static AnalysisOutcome failure(FailureKind kind, std::string detail);
};

class Analyzer {
public:
    explicit Analyzer(std::shared_ptr<MarketDataSource> source,
                      AnalyzerSettings settings = AnalyzerSettings());

    // Request boundary: every stage failure comes back as no_result
    AnalysisOutcome analyze(const std::string& symbol, Timeframe tf,
                            const CancelCheck& cancel = nullptr) const;

    // Same pipeline on a series the caller already holds
    AnalysisOutcome analyze_series(const std::string& symbol, Timeframe tf, Series series) const;

    // Pure stages; throws AnalysisError
    static AnalysisResult run_pipeline(const Series& series,
                                       const AnalyzerSettings& settings,
                                       std::vector<double>* ema_out = nullptr);

    static std::string normalize_symbol(const std::string& symbol);

    const AnalyzerSettings& settings() const { return settings_; }

private:
    std::shared_ptr<MarketDataSource> source_;
    AnalyzerSettings settings_;
};
