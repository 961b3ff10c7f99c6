#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <iterator>
#include <unordered_map>

namespace {

using Attrs = std::unordered_map<std::string, std::string>;
using Item = std::pair<std::string, Attrs>;
using ItemStream = std::vector<Item>;

}

RedisBus::RedisBus(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {}", redis_url);
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on {}", group, stream);
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Consumer group may exist: {}", e.what());
    }
}

std::vector<BusMessage> RedisBus::read_group(const std::string& stream, const std::string& group,
                                             const std::string& consumer, long long count,
                                             std::chrono::milliseconds block) {
    std::vector<BusMessage> results;

    try {
        std::unordered_map<std::string, ItemStream> items;
        redis_->xreadgroup(group, consumer, stream, ">", block, count,
                           std::inserter(items, items.end()));

        for (const auto& [_, item_stream] : items) {
            for (const auto& item : item_stream) {
                auto it = item.second.find("data");
                if (it == item.second.end()) {
                    spdlog::warn("Message {} has no data field", item.first);
                    ack_message(stream, group, item.first);
                    continue;
                }
                try {
                    results.push_back({item.first, nlohmann::json::parse(it->second)});
                } catch (const nlohmann::json::exception& e) {
                    spdlog::warn("Dropping malformed message {}: {}", item.first, e.what());
                    ack_message(stream, group, item.first);
                }
            }
        }
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to read from {}: {}", stream, e.what());
    }

    return results;
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to ack: {}", e.what());
    }
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();
        redis_->xadd(stream, "*", fields.begin(), fields.end());
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error&) {
        return false;
    }
}
