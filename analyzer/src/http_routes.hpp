#pragma once

#include "api_analyze.hpp"
#include "health.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

// GET /analyze, GET /health, DELETE /cache
void register_routes(httplib::Server& server,
                     std::shared_ptr<AnalyzeHandler> handler,
                     std::shared_ptr<HealthMonitor> health,
                     CancelCheck stopping);

// Owns the listener thread. The port is bound on the caller's thread and
// start() returns only once the server accepts connections, so stop() is
// never lost to a listener that has not started yet.
class ApiServer {
public:
    ApiServer(std::shared_ptr<AnalyzeHandler> handler,
              std::shared_ptr<HealthMonitor> health,
              CancelCheck stopping);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // port 0 picks a free port. Returns the bound port, -1 if binding failed.
    int start(const std::string& addr, int port);
    void stop();

    bool running() const { return thread_.joinable(); }

private:
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
};
