#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iterator>
#include <unordered_map>

namespace {

using Attrs = std::unordered_map<std::string, std::string>;
using Item = std::pair<std::string, Attrs>;
using ItemStream = std::vector<Item>;

} // namespace

RedisBus::RedisBus(const std::string& redis_url, const std::string& group,
                   const std::string& consumer)
    : group_(group)
    , consumer_(consumer)
{
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::ensure_group(const std::string& stream) {
    try {
        redis_->xgroup_create(stream, group_, "$", true);
        spdlog::info("Created consumer group {} on stream {}", group_, stream);
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Consumer group {} already present: {}", group_, e.what());
    }
}

std::vector<StreamMessage> RedisBus::read_commands(const std::string& stream, int count,
                                                   int block_ms) {
    std::vector<StreamMessage> results;
    
    try {
        std::unordered_map<std::string, ItemStream> items;
        
        redis_->xreadgroup(group_, consumer_,
            stream, ">",
            std::chrono::milliseconds(block_ms),
            count,
            std::inserter(items, items.end()));
        
        for (const auto& [stream_name, item_stream] : items) {
            for (const auto& item : item_stream) {
                auto it = item.second.find("data");
                if (it == item.second.end()) {
                    spdlog::warn("Message {} on {} has no data field", item.first, stream_name);
                    ack_message(stream, item.first);
                    continue;
                }
                try {
                    results.emplace_back(item.first, nlohmann::json::parse(it->second));
                } catch (const nlohmann::json::exception& e) {
                    spdlog::error("Dropping unparseable message {}: {}", item.first, e.what());
                    ack_message(stream, item.first);
                }
            }
        }
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to read commands: {}", e.what());
    }
    
    return results;
}

void RedisBus::append(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = data.dump();
    redis_->xadd(stream, "*", fields.begin(), fields.end());
}

void RedisBus::publish_reply(const std::string& stream, const nlohmann::json& data) {
    try {
        append(stream, data);
        spdlog::debug("Published reply to {}", stream);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish reply: {}", e.what());
        throw;
    }
}

void RedisBus::publish_audit(const std::string& stream, const nlohmann::json& data) {
    try {
        append(stream, data);
        spdlog::debug("Published audit event {}", data.value("event", ""));
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish audit: {}", e.what());
    }
}

void RedisBus::ack_message(const std::string& stream, const std::string& msg_id) {
    try {
        redis_->xack(stream, group_, msg_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to ack message {}: {}", msg_id, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
