#include "hermes_client.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

std::string strip_hex_prefix(const std::string& id) {
    if (id.size() > 2 && id[0] == '0' && (id[1] == 'x' || id[1] == 'X')) {
        return id.substr(2);
    }
    return id;
}

} // namespace

HermesClient::HermesClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , curl_(curl_easy_init())
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL for Hermes");
    }
    
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
}

HermesClient::~HermesClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t HermesClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json HermesClient::make_request(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::string response_string;
    std::string url = base_url_ + endpoint;
    
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);
    
    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        healthy_ = false;
        spdlog::error("Hermes request failed: {}", curl_easy_strerror(res));
        throw VaultError(ErrorCode::InvalidPrice,
                         std::string("price service unavailable: ") + curl_easy_strerror(res));
    }
    
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        healthy_ = false;
        spdlog::error("Hermes returned HTTP {}", status);
        throw VaultError(ErrorCode::InvalidPrice, "price service returned HTTP " +
                         std::to_string(status));
    }
    
    try {
        auto body = nlohmann::json::parse(response_string);
        healthy_ = true;
        return body;
    } catch (const nlohmann::json::exception& e) {
        healthy_ = false;
        spdlog::error("Failed to parse Hermes response: {}", e.what());
        throw VaultError(ErrorCode::InvalidPrice, "malformed price service response");
    }
}

OracleQuote HermesClient::parse_latest(const nlohmann::json& body, const std::string& feed_id) {
    std::string wanted = strip_hex_prefix(feed_id);
    
    if (!body.contains("parsed") || !body["parsed"].is_array()) {
        throw VaultError(ErrorCode::InvalidPrice, "no parsed prices in response");
    }
    
    for (const auto& entry : body["parsed"]) {
        if (strip_hex_prefix(entry.value("id", "")) != wanted) continue;
        
        try {
            const auto& price = entry.at("price");
            OracleQuote quote;
            // Hermes encodes the price mantissa as a decimal string
            const auto& raw = price.at("price");
            quote.raw_price = raw.is_string() ? std::stoll(raw.get<std::string>())
                                              : raw.get<int64_t>();
            quote.raw_exponent = price.at("expo").get<int32_t>();
            quote.observed_at = price.at("publish_time").get<int64_t>();
            return quote;
        } catch (const std::exception& e) {
            throw VaultError(ErrorCode::InvalidPrice,
                             "malformed quote for " + feed_id + ": " + e.what());
        }
    }
    
    throw VaultError(ErrorCode::InvalidPrice, "no quote for feed " + feed_id);
}

OracleQuote HermesClient::get_quote(const std::string& feed_id) {
    auto body = make_request("/v2/updates/price/latest?ids[]=" + feed_id);
    auto quote = parse_latest(body, feed_id);
    spdlog::debug("Hermes {}: {}e{} at {}", feed_id, quote.raw_price, quote.raw_exponent,
                  quote.observed_at);
    return quote;
}
