#include "result_cache.hpp"
#include <spdlog/spdlog.h>

AnalysisCache::AnalysisCache(int ttl_seconds, NowFn now)
    : ttl_seconds_(ttl_seconds), now_(std::move(now)) {}

bool AnalysisCache::is_expired(const Entry& entry, Clock::time_point now) const {
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - entry.cached_at).count();
    return age >= ttl_seconds_;
}

std::optional<AnalysisReport> AnalysisCache::get(const std::string& symbol, Timeframe tf) {
    if (!enabled()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find({symbol, tf});
    if (it == cache_.end()) return std::nullopt;

    if (is_expired(it->second, now_())) {
        cache_.erase(it);
        return std::nullopt;
    }
    return it->second.report;
}

void AnalysisCache::put(const AnalysisReport& report) {
    if (!enabled()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[{report.symbol, report.timeframe}] = Entry{report, now_()};
}

bool AnalysisCache::invalidate(const std::string& symbol, Timeframe tf) {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.erase({symbol, tf}) > 0;
}

size_t AnalysisCache::invalidate_symbol(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->first.first == symbol) {
            it = cache_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t AnalysisCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = cache_.size();
    cache_.clear();
    spdlog::info("Analysis cache cleared ({} entries)", removed);
    return removed;
}

size_t AnalysisCache::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (is_expired(it->second, now)) {
            it = cache_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Purged {} expired cache entries", removed);
    }
    return removed;
}

size_t AnalysisCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}
