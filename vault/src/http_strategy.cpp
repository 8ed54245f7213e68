#include "http_strategy.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

HttpYieldStrategy::HttpYieldStrategy(const std::string& base_url, const std::string& strategy_id,
                                     int timeout_ms)
    : base_url_(base_url)
    , strategy_id_(strategy_id)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for strategy gateway");
    }
    
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
}

HttpYieldStrategy::~HttpYieldStrategy() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HttpYieldStrategy::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json HttpYieldStrategy::make_request(const std::string& endpoint,
                                               const nlohmann::json* body) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::string response_string;
    std::string url = base_url_ + "/strategies/" + strategy_id_ + endpoint;
    std::string payload;
    
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    
    struct curl_slist* headers = nullptr;
    if (body) {
        payload = body->dump();
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
    }
    
    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);
    
    if (res != CURLE_OK) {
        spdlog::error("Strategy request {} failed: {}", endpoint, curl_easy_strerror(res));
        throw std::runtime_error(std::string("strategy gateway: ") + curl_easy_strerror(res));
    }
    
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw std::runtime_error("strategy gateway returned HTTP " + std::to_string(status));
    }
    
    return response_string.empty() ? nlohmann::json::object()
                                   : nlohmann::json::parse(response_string);
}

void HttpYieldStrategy::stake(uint64_t amount) {
    nlohmann::json body = {{"amount", amount}};
    make_request("/stake", &body);
}

uint64_t HttpYieldStrategy::unstake(uint64_t amount) {
    nlohmann::json body = {{"amount", amount}};
    auto reply = make_request("/unstake", &body);
    return reply.at("received").get<uint64_t>();
}

uint64_t HttpYieldStrategy::current_value() {
    auto reply = make_request("/value", nullptr);
    return reply.at("value").get<uint64_t>();
}
