#include "analyzer.hpp"
#include "signals.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

AnalysisOutcome AnalysisOutcome::success(AnalysisReport report) {
    AnalysisOutcome out;
    out.report = std::move(report);
    return out;
}

AnalysisOutcome AnalysisOutcome::failure(FailureKind kind, std::string detail) {
    AnalysisOutcome out;
    out.no_result = NoResult{kind, std::move(detail)};
    return out;
}

Analyzer::Analyzer(std::shared_ptr<MarketDataSource> source, AnalyzerSettings settings)
    : source_(std::move(source)), settings_(settings) {}

std::string Analyzer::normalize_symbol(const std::string& symbol) {
    return util::to_upper(util::trim(symbol));
}

AnalysisOutcome Analyzer::analyze(const std::string& symbol, Timeframe tf, const CancelCheck& cancel) const {
    const std::string sym = normalize_symbol(symbol);

    FetchResult fetched;
    try {
        fetched = source_->fetch(sym, tf, cancel);
    } catch (const std::exception& e) {
        fetched = FetchResult::unavailable(e.what());
    }

    if (!fetched.ok()) {
        spdlog::info("No result for {} {}: {} ({})", sym, to_string(tf),
                     to_string(FailureKind::DataUnavailable), *fetched.error);
        return AnalysisOutcome::failure(FailureKind::DataUnavailable, *fetched.error);
    }

    return analyze_series(sym, tf, std::move(fetched.series));
}

AnalysisOutcome Analyzer::analyze_series(const std::string& symbol, Timeframe tf, Series series) const {
    try {
        if (series.size() < settings_.min_bars) {
            throw AnalysisError(FailureKind::InsufficientData,
                                std::to_string(series.size()) + " bars, need " +
                                std::to_string(settings_.min_bars));
        }

        AnalysisReport report;
        report.symbol = symbol;
        report.timeframe = tf;
        report.result = run_pipeline(series, settings_, &report.ema);
        report.series = std::move(series);
        report.generated_at = util::current_iso8601();

        spdlog::debug("{} {}: {}/{} passing, close={} ema={}",
                      symbol, to_string(tf), report.result.passing, report.result.signals.size(),
                      report.result.last_close, report.result.ema_last);

        return AnalysisOutcome::success(std::move(report));

    } catch (const AnalysisError& e) {
        spdlog::info("No result for {} {}: {} ({})", symbol, to_string(tf),
                     to_string(e.kind()), e.what());
        return AnalysisOutcome::failure(e.kind(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Analysis error for {} {}: {}", symbol, to_string(tf), e.what());
        return AnalysisOutcome::failure(FailureKind::ComputationError, e.what());
    }
}

AnalysisResult Analyzer::run_pipeline(const Series& series,
                                      const AnalyzerSettings& settings,
                                      std::vector<double>* ema_out) {
    if (series.empty()) {
        throw AnalysisError(FailureKind::DataUnavailable, "empty series");
    }

    // Indicators and levels both depend only on the series
    IndicatorSet indicators = IndicatorEngine::compute(series, settings.indicators);
    LevelSet levels = LevelDetector::detect(series, settings.levels);

    const double last_close = series.back().close;

    PatternFlags patterns = PatternEvaluator::evaluate(series, indicators, levels, settings.patterns);
    RiskLevels risk = RiskCalculator::compute(last_close, indicators.atr, settings.risk);

    AnalysisResult result;
    result.signals = SignalAggregator::build_checklist(patterns, risk);
    result.passing = SignalAggregator::count_passing(result.signals);
    result.verdict = SignalAggregator::classify(result.passing);
    result.stop_loss = risk.stop_loss;
    result.target = risk.target;
    result.rr_ratio = risk.rr_ratio;
    result.atr = indicators.atr;
    result.levels = std::move(levels);
    result.last_close = last_close;
    result.ema_last = indicators.ema.back();

    if (ema_out) {
        *ema_out = std::move(indicators.ema);
    }
    return result;
}
