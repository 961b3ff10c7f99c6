#pragma once

#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <string>

class HealthMonitor {
public:
    HealthMonitor();

    void set_redis(bool enabled, bool ok);
    void set_loop_status(const std::string& status);

    void record_result(bool from_cache);
    void record_no_result(FailureKind kind);

    nlohmann::json to_json() const;
    bool is_ok() const;

private:
    mutable std::mutex mutex_;
    bool redis_enabled_;
    bool redis_ok_;
    std::string loop_status_;
    std::string last_analysis_ts_;
    std::string started_at_;

    long long results_;
    long long cache_hits_;
    std::map<std::string, long long> no_results_;
};
