#pragma once

#include "collaborators.hpp"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Yield strategy reached through its HTTP gateway:
//   GET  /strategies/<id>/value    -> {"value": n}
//   POST /strategies/<id>/stake    {"amount": n}
//   POST /strategies/<id>/unstake  {"amount": n} -> {"received": n}
class HttpYieldStrategy : public YieldStrategy {
public:
    HttpYieldStrategy(const std::string& base_url, const std::string& strategy_id,
                      int timeout_ms = 2500);
    ~HttpYieldStrategy();
    
    HttpYieldStrategy(const HttpYieldStrategy&) = delete;
    HttpYieldStrategy& operator=(const HttpYieldStrategy&) = delete;
    
    std::string strategy_id() const override { return strategy_id_; }
    void stake(uint64_t amount) override;
    uint64_t unstake(uint64_t amount) override;
    uint64_t current_value() override;
    
private:
    std::string base_url_;
    std::string strategy_id_;
    int timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;
    
    nlohmann::json make_request(const std::string& endpoint, const nlohmann::json* body);
    
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
