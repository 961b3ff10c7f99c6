#include "http_routes.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

std::string param(const httplib::Request& req, const char* name) {
    return req.has_param(name) ? req.get_param_value(name) : std::string();
}

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

}

void register_routes(httplib::Server& server,
                     std::shared_ptr<AnalyzeHandler> handler,
                     std::shared_ptr<HealthMonitor> health,
                     CancelCheck stopping) {

    server.Get("/analyze", [handler, stopping](const httplib::Request& req, httplib::Response& res) {
        try {
            std::string fresh = param(req, "fresh");
            auto reply = handler->analyze(param(req, "symbol"), param(req, "timeframe"),
                                          fresh == "1" || fresh == "true", stopping);
            send_json(res, reply.status, reply.body);
        } catch (const std::exception& e) {
            spdlog::error("GET /analyze failed: {}", e.what());
            send_json(res, 500, {{"ok", false}, {"error", "internal error"}});
        }
    });

    server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
        send_json(res, health->is_ok() ? 200 : 503, health->to_json());
    });

    server.Delete("/cache", [handler](const httplib::Request& req, httplib::Response& res) {
        try {
            auto reply = handler->invalidate(param(req, "symbol"), param(req, "timeframe"));
            send_json(res, reply.status, reply.body);
        } catch (const std::exception& e) {
            spdlog::error("DELETE /cache failed: {}", e.what());
            send_json(res, 500, {{"ok", false}, {"error", "internal error"}});
        }
    });
}

ApiServer::ApiServer(std::shared_ptr<AnalyzeHandler> handler,
                     std::shared_ptr<HealthMonitor> health,
                     CancelCheck stopping)
    : server_(std::make_unique<httplib::Server>())
{
    register_routes(*server_, std::move(handler), std::move(health), std::move(stopping));
}

ApiServer::~ApiServer() {
    stop();
}

int ApiServer::start(const std::string& addr, int port) {
    if (running()) {
        throw std::logic_error("HTTP server already started");
    }

    int bound = -1;
    if (port == 0) {
        bound = server_->bind_to_any_port(addr.c_str());
    } else if (server_->bind_to_port(addr.c_str(), port)) {
        bound = port;
    }
    if (bound < 0) {
        spdlog::error("HTTP server failed to bind {}:{}", addr, port);
        return -1;
    }

    thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            spdlog::error("HTTP server stopped with an error");
        }
    });
    server_->wait_until_ready();

    spdlog::info("HTTP server listening on {}:{}", addr, bound);
    return bound;
}

void ApiServer::stop() {
    if (!thread_.joinable()) return;

    server_->stop();
    thread_.join();
    spdlog::info("HTTP server stopped");
}
