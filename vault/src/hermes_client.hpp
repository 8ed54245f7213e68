#pragma once

#include "collaborators.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

// Pyth Hermes price service
class HermesClient : public OracleProvider {
public:
    explicit HermesClient(const std::string& base_url, int timeout_ms = 2500);
    ~HermesClient();
    
    HermesClient(const HermesClient&) = delete;
    HermesClient& operator=(const HermesClient&) = delete;
    
    OracleQuote get_quote(const std::string& feed_id) override;
    bool is_healthy() override { return healthy_; }
    
    // Extracts the quote for feed_id from a /v2/updates/price/latest body
    static OracleQuote parse_latest(const nlohmann::json& body, const std::string& feed_id);
    
private:
    std::string base_url_;
    int timeout_ms_;
    CURL* curl_;
    std::mutex mutex_;
    std::atomic<bool> healthy_{true};
    
    nlohmann::json make_request(const std::string& endpoint);
    
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
