#pragma once

#include <string>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

// Returns true when the caller wants the transfer aborted
using CancelCheck = std::function<bool()>;

struct HttpResponse {
    long status_code;
    std::string body;
};

class HttpClient {
public:
    explicit HttpClient(int timeout_ms = 10000, std::string user_agent = "swingcheck/1.0");
    virtual ~HttpClient() = default;

    // Single attempt, no retries. nullopt on transport failure, timeout or cancel.
    std::optional<HttpResponse> get(const std::string& url, const CancelCheck& cancel = nullptr) const;

    // nullopt additionally on HTTP status >= 400 or unparsable JSON
    virtual std::optional<nlohmann::json> get_json(const std::string& url,
                                                   const CancelCheck& cancel = nullptr) const;

    int timeout_ms() const { return timeout_ms_; }

private:
    int timeout_ms_;
    std::string user_agent_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
