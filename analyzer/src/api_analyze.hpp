#pragma once

#include "analyzer.hpp"
#include "result_cache.hpp"
#include "health.hpp"
#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

struct ApiReply {
    int status;
    nlohmann::json body;
};

// Shared by the HTTP routes and the Redis command consumer. The cache is
// consulted here, before the pipeline runs, never inside it.
class AnalyzeHandler {
public:
    AnalyzeHandler(std::shared_ptr<Analyzer> analyzer,
                   std::shared_ptr<AnalysisCache> cache,
                   std::shared_ptr<HealthMonitor> health);

    ApiReply analyze(const std::string& symbol, const std::string& timeframe,
                     bool fresh = false, const CancelCheck& cancel = nullptr);

    // Empty symbol/timeframe widen the scope; both empty clears everything
    ApiReply invalidate(const std::string& symbol, const std::string& timeframe);

    // {"cmd":"analyze","args":{"symbol","timeframe"},"corr_id"} -> reply json
    nlohmann::json handle_command(const nlohmann::json& req, const CancelCheck& cancel = nullptr);

private:
    std::shared_ptr<Analyzer> analyzer_;
    std::shared_ptr<AnalysisCache> cache_;
    std::shared_ptr<HealthMonitor> health_;

    static ApiReply bad_request(const std::string& why);
};
