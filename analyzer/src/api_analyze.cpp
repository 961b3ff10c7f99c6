#include "api_analyze.hpp"
#include "report.hpp"
#include "signals.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

AnalyzeHandler::AnalyzeHandler(std::shared_ptr<Analyzer> analyzer,
                               std::shared_ptr<AnalysisCache> cache,
                               std::shared_ptr<HealthMonitor> health)
    : analyzer_(std::move(analyzer)), cache_(std::move(cache)), health_(std::move(health)) {}

ApiReply AnalyzeHandler::bad_request(const std::string& why) {
    return {400, {{"ok", false}, {"error", why}}};
}

ApiReply AnalyzeHandler::analyze(const std::string& symbol, const std::string& timeframe,
                                 bool fresh, const CancelCheck& cancel) {
    const std::string sym = Analyzer::normalize_symbol(symbol);
    if (sym.empty()) {
        return bad_request("symbol is required");
    }

    auto tf = parse_timeframe(util::trim(timeframe.empty() ? "1d" : timeframe));
    if (!tf.has_value()) {
        return bad_request("unknown timeframe: " + timeframe);
    }

    if (!fresh) {
        if (auto cached = cache_->get(sym, *tf)) {
            spdlog::debug("Cache hit for {} {}", sym, to_string(*tf));
            health_->record_result(true);
            return {200, ReportFormatter::to_json(*cached, true)};
        }
    }

    auto outcome = analyzer_->analyze(sym, *tf, cancel);
    if (!outcome.ok()) {
        health_->record_no_result(outcome.no_result->kind);
        return {200, ReportFormatter::no_result_json()};
    }

    cache_->put(*outcome.report);
    health_->record_result(false);

    spdlog::info("Analyzed {} {}: {}/{} ({})", sym, to_string(*tf),
                 outcome.report->result.passing, outcome.report->result.signals.size(),
                 SignalAggregator::verdict_id(outcome.report->result.verdict));
    return {200, ReportFormatter::to_json(*outcome.report, false)};
}

ApiReply AnalyzeHandler::invalidate(const std::string& symbol, const std::string& timeframe) {
    const std::string sym = Analyzer::normalize_symbol(symbol);
    size_t removed = 0;

    if (!timeframe.empty()) {
        auto tf = parse_timeframe(util::trim(timeframe));
        if (!tf.has_value()) {
            return bad_request("unknown timeframe: " + timeframe);
        }
        if (sym.empty()) {
            return bad_request("symbol is required with timeframe");
        }
        removed = cache_->invalidate(sym, *tf) ? 1 : 0;
    } else if (!sym.empty()) {
        removed = cache_->invalidate_symbol(sym);
    } else {
        removed = cache_->clear();
    }

    return {200, {{"ok", true}, {"removed", removed}}};
}

nlohmann::json AnalyzeHandler::handle_command(const nlohmann::json& req, const CancelCheck& cancel) {
    nlohmann::json reply = {
        {"type", "reply"},
        {"cmd", req.contains("cmd") ? req["cmd"] : nlohmann::json("")},
        {"corr_id", req.contains("corr_id") ? req["corr_id"] : nlohmann::json("")},
        {"ts", util::current_iso8601()}
    };

    const nlohmann::json args = req.contains("args") && req["args"].is_object()
        ? req["args"] : nlohmann::json::object();

    ApiReply result;
    try {
        std::string symbol = args.value("symbol", "");
        std::string timeframe = args.value("timeframe", "1d");
        bool fresh = args.value("fresh", false);
        result = analyze(symbol, timeframe, fresh, cancel);
    } catch (const nlohmann::json::type_error& e) {
        spdlog::warn("Bad args in command {}: {}", reply["corr_id"].dump(), e.what());
        result = bad_request("symbol and timeframe must be strings, fresh a boolean");
    }

    reply["status"] = result.status;
    reply["result"] = result.body;
    return reply;
}
