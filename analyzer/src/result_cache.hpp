#pragma once

#include "analyzer.hpp"
#include "timeframe.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

// Successful reports keyed by (symbol, timeframe). Owned by the service,
// never touched from inside the analysis pipeline.
class AnalysisCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    // ttl_seconds <= 0 disables caching
    explicit AnalysisCache(int ttl_seconds = 300, NowFn now = &Clock::now);

    std::optional<AnalysisReport> get(const std::string& symbol, Timeframe tf);
    void put(const AnalysisReport& report);

    bool invalidate(const std::string& symbol, Timeframe tf);
    size_t invalidate_symbol(const std::string& symbol);
    size_t clear();
    size_t purge_expired();

    size_t size() const;
    bool enabled() const { return ttl_seconds_ > 0; }

private:
    struct Entry {
        AnalysisReport report;
        Clock::time_point cached_at;
    };
    using Key = std::pair<std::string, Timeframe>;

    int ttl_seconds_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::map<Key, Entry> cache_;

    bool is_expired(const Entry& entry, Clock::time_point now) const;
};
