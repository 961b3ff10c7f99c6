#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.chart_api_base = get_env("CHART_API_BASE", "https://query1.finance.yahoo.com/v8/finance/chart");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 10000);
    cfg.session_open = get_env("SESSION_OPEN", "09:15");
    cfg.session_close = get_env("SESSION_CLOSE", "15:30");

    cfg.ema_window = get_env_int("EMA_WINDOW", 50);
    cfg.atr_window = get_env_int("ATR_WINDOW", 14);
    cfg.level_lookback_bars = get_env_int("LEVEL_LOOKBACK_BARS", 50);
    cfg.level_min_separation = get_env_int("LEVEL_MIN_SEPARATION", 5);
    cfg.level_min_prominence = get_env_double("LEVEL_MIN_PROMINENCE", 1.0);

    cfg.near_resistance_pct = get_env_double("NEAR_RESISTANCE_PCT", 2.0);
    cfg.volume_spike_mult = get_env_double("VOLUME_SPIKE_MULT", 1.5);

    cfg.stop_atr_mult = get_env_double("STOP_ATR_MULT", 2.0);
    cfg.target_atr_mult = get_env_double("TARGET_ATR_MULT", 4.0);
    cfg.min_rr_ratio = get_env_double("MIN_RR_RATIO", 2.0);

    cfg.cache_ttl_seconds = get_env_int("CACHE_TTL_SECONDS", 300);

    cfg.redis_url = get_env("REDIS_URL");
    cfg.stream_req = get_env("STREAM_REQ", "swingcheck.cmd.requests");
    cfg.stream_rep = get_env("STREAM_REP", "swingcheck.cmd.replies");

    cfg.service_name = get_env("SERVICE_NAME", "swingcheck");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT out of range");
    }
    if (chart_api_base.empty()) {
        throw std::runtime_error("CHART_API_BASE is required");
    }
    if (request_timeout_ms <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_MS must be positive");
    }

    auto open = util::parse_hhmm(session_open);
    auto close = util::parse_hhmm(session_close);
    if (!open || !close || *open >= *close) {
        throw std::runtime_error("SESSION_OPEN/SESSION_CLOSE must be HH:MM with open before close");
    }

    if (ema_window <= 0 || atr_window <= 0) {
        throw std::runtime_error("EMA_WINDOW and ATR_WINDOW must be positive");
    }
    if (level_lookback_bars < 3 || level_min_separation < 1 || level_min_prominence < 0.0) {
        throw std::runtime_error("Invalid level detection parameters");
    }
    if (near_resistance_pct < 0.0 || volume_spike_mult <= 0.0) {
        throw std::runtime_error("Invalid pattern thresholds");
    }
    if (stop_atr_mult <= 0.0 || target_atr_mult <= 0.0 || min_rr_ratio <= 0.0) {
        throw std::runtime_error("Risk multipliers must be positive");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  EMA/ATR windows: {}/{}", ema_window, atr_window);
    spdlog::info("  Levels: lookback={} separation={} prominence={}",
                 level_lookback_bars, level_min_separation, level_min_prominence);
    spdlog::info("  Risk: stop={}xATR target={}xATR min R/R={}",
                 stop_atr_mult, target_atr_mult, min_rr_ratio);
    spdlog::info("  Session: {}-{}, cache TTL {}s", session_open, session_close, cache_ttl_seconds);
}

AnalyzerSettings Config::analyzer_settings() const {
    AnalyzerSettings s;

    s.indicators.ema_window = static_cast<size_t>(ema_window);
    s.indicators.atr_window = static_cast<size_t>(atr_window);

    s.levels.lookback_bars = static_cast<size_t>(level_lookback_bars);
    s.levels.min_separation = static_cast<size_t>(level_min_separation);
    s.levels.min_prominence = level_min_prominence;

    s.patterns.near_resistance_pct = near_resistance_pct;
    s.patterns.volume_spike_mult = volume_spike_mult;

    s.risk.stop_atr_mult = stop_atr_mult;
    s.risk.target_atr_mult = target_atr_mult;
    s.risk.min_rr_ratio = min_rr_ratio;

    return s;
}

SessionWindow Config::session_window() const {
    SessionWindow w;
    if (auto open = util::parse_hhmm(session_open)) w.open_minute = *open;
    if (auto close = util::parse_hhmm(session_close)) w.close_minute = *close;
    return w;
}
