#include "mock_oracle.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

MockPriceOracle::MockPriceOracle(const std::string& authority)
    : authority_(authority)
{}

void MockPriceOracle::update_prices(const std::string& caller,
                                    const std::map<std::string, int64_t>& prices_usd_micro,
                                    int64_t now) {
    if (caller != authority_) {
        spdlog::warn("Rejected mock oracle update from {}", caller);
        throw VaultError(ErrorCode::Unauthorized, "only the oracle authority can update prices");
    }
    
    for (const auto& [feed, price] : prices_usd_micro) {
        if (price <= 0 || price >= kMaxPriceUsdMicro) {
            throw VaultError(ErrorCode::InvalidPrice,
                             "price for " + feed + " out of range: " + std::to_string(price));
        }
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [feed, price] : prices_usd_micro) {
        prices_[feed] = price;
    }
    last_update_ = now;
    
    spdlog::info("Mock oracle updated {} prices", prices_usd_micro.size());
}

OracleQuote MockPriceOracle::get_quote(const std::string& feed_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = prices_.find(feed_id);
    if (it == prices_.end()) {
        throw VaultError(ErrorCode::InvalidPrice, "no mock price for " + feed_id);
    }
    
    OracleQuote quote;
    quote.raw_price = it->second;
    quote.raw_exponent = -6;
    quote.observed_at = last_update_;
    return quote;
}

int64_t MockPriceOracle::last_update() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_update_;
}
