#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

using StreamMessage = std::pair<std::string, nlohmann::json>;

// Command and reply streams of one consumer group
class RedisBus {
public:
    RedisBus(const std::string& redis_url, const std::string& group, const std::string& consumer);
    
    void ensure_group(const std::string& stream);
    
    std::vector<StreamMessage> read_commands(const std::string& stream, int count = 10,
                                             int block_ms = 1000);
    
    void publish_reply(const std::string& stream, const nlohmann::json& data);
    
    // Audit delivery is best effort and never fails the command
    void publish_audit(const std::string& stream, const nlohmann::json& data);
    
    void ack_message(const std::string& stream, const std::string& msg_id);
    
    bool ping();
    
private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string group_;
    std::string consumer_;
    
    void append(const std::string& stream, const nlohmann::json& data);
};
