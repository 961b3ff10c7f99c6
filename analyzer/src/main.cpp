#include "config.hpp"
#include "http_client.hpp"
#include "market_data.hpp"
#include "analyzer.hpp"
#include "result_cache.hpp"
#include "health.hpp"
#include "api_analyze.hpp"
#include "http_routes.hpp"
#include "redis_bus.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

struct CurlGlobalGuard {
    ~CurlGlobalGuard() { curl_global_cleanup(); }
};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

// Blocks until shutdown; answers analyze commands from the request stream
void run_command_loop(RedisBus& redis, const Config& config,
                      AnalyzeHandler& handler, HealthMonitor& health,
                      AnalysisCache& cache, const CancelCheck& stopping) {
    const std::string group = config.service_name + "_cmd_group";
    const std::string consumer = config.service_name + "_cmd_consumer";
    redis.create_consumer_group(config.stream_req, group);

    auto last_purge = std::chrono::steady_clock::now();

    while (!shutdown_requested) {
        try {
            auto requests = redis.read_group(config.stream_req, group, consumer,
                                             10, std::chrono::milliseconds(500));

            for (const auto& msg : requests) {
                try {
                    if (msg.data.is_object() && msg.data.contains("cmd") && msg.data["cmd"] == "analyze") {
                        auto reply = handler.handle_command(msg.data, stopping);
                        redis.publish(config.stream_rep, reply);
                        spdlog::debug("Replied to analyze command {}", msg.id);
                    } else {
                        spdlog::warn("Ignoring unknown command in {}", msg.id);
                    }
                } catch (const std::exception& e) {
                    spdlog::error("Error handling command {}: {}", msg.id, e.what());
                }
                redis.ack_message(config.stream_req, group, msg.id);
            }

            health.set_redis(true, redis.ping());

            auto now = std::chrono::steady_clock::now();
            if (now - last_purge > std::chrono::seconds(60)) {
                cache.purge_expired();
                last_purge = now;
            }

        } catch (const std::exception& e) {
            spdlog::error("Error in command loop: {}", e.what());
            health.set_loop_status("error");
            std::this_thread::sleep_for(std::chrono::seconds(1));
            health.set_loop_status("running");
        }
    }
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.service_name, config.log_level);
        config.validate();

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
            return 1;
        }
        CurlGlobalGuard curl_guard;

        auto http = std::make_shared<HttpClient>(config.request_timeout_ms);
        auto source = std::make_shared<ChartApiSource>(config.chart_api_base, http,
                                                       config.session_window());
        auto analyzer = std::make_shared<Analyzer>(source, config.analyzer_settings());
        auto cache = std::make_shared<AnalysisCache>(config.cache_ttl_seconds);
        auto health = std::make_shared<HealthMonitor>();
        auto handler = std::make_shared<AnalyzeHandler>(analyzer, cache, health);

        CancelCheck stopping = []() { return shutdown_requested.load(); };

        std::unique_ptr<RedisBus> redis;
        if (!config.redis_url.empty()) {
            redis = std::make_unique<RedisBus>(config.redis_url);
            if (!redis->ping()) {
                spdlog::error("Failed to connect to Redis");
                return 1;
            }
            health->set_redis(true, true);
        } else {
            spdlog::info("REDIS_URL not set, command stream disabled");
            health->set_redis(false, false);
        }

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        // Stops and joins the listener on every exit path, exceptions included
        ApiServer api(handler, health, stopping);
        if (api.start(config.listen_addr, config.listen_port) < 0) {
            return 1;
        }

        health->set_loop_status("running");

        if (redis) {
            run_command_loop(*redis, config, *handler, *health, *cache, stopping);
        } else {
            auto last_purge = std::chrono::steady_clock::now();
            while (!shutdown_requested) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                auto now = std::chrono::steady_clock::now();
                if (now - last_purge > std::chrono::seconds(60)) {
                    cache->purge_expired();
                    last_purge = now;
                }
            }
        }

        spdlog::info("Shutting down gracefully");
        health->set_loop_status("shutdown");
        api.stop();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
