#include "report.hpp"
#include "signals.hpp"
#include "util.hpp"

nlohmann::json ReportFormatter::to_json(const AnalysisReport& report, bool cached) {
    const auto& r = report.result;

    nlohmann::json results = nlohmann::json::array();
    for (const auto& item : r.signals) {
        results.push_back({
            {"id", item.id},
            {"label", item.label},
            {"passed", item.passed}
        });
    }

    return {
        {"ok", true},
        {"symbol", report.symbol},
        {"timeframe", to_string(report.timeframe)},
        {"results", results},
        {"passing", r.passing},
        {"total", r.signals.size()},
        {"summary", SignalAggregator::summary(r.signals)},
        {"verdict", SignalAggregator::verdict_id(r.verdict)},
        {"verdict_label", SignalAggregator::verdict_label(r.verdict)},
        {"stop_loss", util::round2(r.stop_loss)},
        {"target", util::round2(r.target)},
        {"rr_ratio", util::round2(r.rr_ratio)},
        {"atr", util::round2(r.atr)},
        {"last_close", r.last_close},
        {"ema_last", util::round2(r.ema_last)},
        {"levels", levels_json(r.levels)},
        {"chart", chart_json(report.series, report.ema)},
        {"generated_at", report.generated_at},
        {"cached", cached}
    };
}

nlohmann::json ReportFormatter::no_result_json() {
    return {
        {"ok", false},
        {"error", "analysis unavailable"}
    };
}

nlohmann::json ReportFormatter::levels_json(const LevelSet& levels) {
    return {
        {"support", levels.support},
        {"resistance", levels.resistance}
    };
}

nlohmann::json ReportFormatter::chart_json(const Series& series, const std::vector<double>& ema) {
    nlohmann::json bars = nlohmann::json::array();
    for (const auto& b : series) {
        bars.push_back({
            {"t", b.timestamp},
            {"o", b.open},
            {"h", b.high},
            {"l", b.low},
            {"c", b.close},
            {"v", b.volume}
        });
    }

    return {
        {"bars", bars},
        {"ema", ema}
    };
}
