#include "health.hpp"
#include "util.hpp"

HealthMonitor::HealthMonitor()
    : redis_enabled_(false)
    , redis_ok_(true)
    , loop_status_("starting")
    , started_at_(util::current_iso8601())
    , results_(0)
    , cache_hits_(0)
{}

void HealthMonitor::set_redis(bool enabled, bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    redis_enabled_ = enabled;
    redis_ok_ = ok;
}

void HealthMonitor::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthMonitor::record_result(bool from_cache) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_++;
    if (from_cache) cache_hits_++;
    last_analysis_ts_ = util::current_iso8601();
}

void HealthMonitor::record_no_result(FailureKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    no_results_[to_string(kind)]++;
}

nlohmann::json HealthMonitor::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json failures = nlohmann::json::object();
    for (const auto& [kind, count] : no_results_) {
        failures[kind] = count;
    }

    return {
        {"ok", loop_status_ == "running" && (!redis_enabled_ || redis_ok_)},
        {"loop", loop_status_},
        {"redis", redis_enabled_ ? (redis_ok_ ? "up" : "down") : "disabled"},
        {"results", results_},
        {"cache_hits", cache_hits_},
        {"no_results", failures},
        {"last_analysis_ts", last_analysis_ts_.empty() ? nlohmann::json() : nlohmann::json(last_analysis_ts_)},
        {"started_at", started_at_}
    };
}

bool HealthMonitor::is_ok() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loop_status_ == "running" && (!redis_enabled_ || redis_ok_);
}
