#include "http_client.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>

namespace {

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancelCheck*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return (*cancel && (*cancel)()) ? 1 : 0;
}

}

HttpClient::HttpClient(int timeout_ms, std::string user_agent)
    : timeout_ms_(timeout_ms)
    , user_agent_(std::move(user_agent))
{}

size_t HttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::optional<HttpResponse> HttpClient::get(const std::string& url, const CancelCheck& cancel) const {
    if (cancel && cancel()) {
        spdlog::debug("Request cancelled before start: {}", url);
        return std::nullopt;
    }

    // One easy handle per request keeps concurrent callers independent
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        spdlog::error("Failed to initialize CURL");
        return std::nullopt;
    }

    HttpResponse response{0, {}};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());

    if (cancel) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &cancel);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        if (res == CURLE_ABORTED_BY_CALLBACK) {
            spdlog::info("Request cancelled: {}", url);
        } else {
            spdlog::warn("HTTP GET failed: {} ({})", curl_easy_strerror(res), url);
        }
        return std::nullopt;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

std::optional<nlohmann::json> HttpClient::get_json(const std::string& url, const CancelCheck& cancel) const {
    auto response = get(url, cancel);
    if (!response.has_value()) return std::nullopt;

    if (response->status_code >= 400) {
        spdlog::warn("GET {} : {} {}", url, response->status_code, response->body.substr(0, 200));
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(response->body);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse response from {}: {}", url, e.what());
        return std::nullopt;
    }
}
