#pragma once

#include "analyzer.hpp"
#include "normalize.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // HTTP
    std::string listen_addr;
    int listen_port;

    // Market data
    std::string chart_api_base;
    int request_timeout_ms;
    std::string session_open;   // "HH:MM" local exchange time
    std::string session_close;

    // Indicators and levels
    int ema_window;
    int atr_window;
    int level_lookback_bars;
    int level_min_separation;
    double level_min_prominence;

    // Patterns
    double near_resistance_pct;
    double volume_spike_mult;

    // Risk (defaults give the fixed 2.0 ratio)
    double stop_atr_mult;
    double target_atr_mult;
    double min_rr_ratio;

    // Cache
    int cache_ttl_seconds;

    // Redis command bus, disabled when redis_url is empty
    std::string redis_url;
    std::string stream_req;
    std::string stream_rep;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    AnalyzerSettings analyzer_settings() const;
    SessionWindow session_window() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
