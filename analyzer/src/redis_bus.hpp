#pragma once
#include <string>
#include <memory>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

struct BusMessage {
    std::string id;
    nlohmann::json data;
};

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    void create_consumer_group(const std::string& stream, const std::string& group);
    std::vector<BusMessage> read_group(const std::string& stream, const std::string& group,
                                       const std::string& consumer, long long count,
                                       std::chrono::milliseconds block);
    void ack_message(const std::string& stream, const std::string& group,
                     const std::string& msg_id);
    void publish(const std::string& stream, const nlohmann::json& data);
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
