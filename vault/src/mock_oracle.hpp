#pragma once

#include "collaborators.hpp"
#include <map>
#include <mutex>
#include <string>

// Devnet oracle holding prices already in USD micro, updated by one authority
class MockPriceOracle : public OracleProvider {
public:
    static constexpr int64_t kMaxPriceUsdMicro = 10000000000000LL;
    
    explicit MockPriceOracle(const std::string& authority);
    
    void update_prices(const std::string& caller,
                       const std::map<std::string, int64_t>& prices_usd_micro,
                       int64_t now);
    
    OracleQuote get_quote(const std::string& feed_id) override;
    
    int64_t last_update() const;
    
private:
    std::string authority_;
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> prices_;
    int64_t last_update_ = 0;
};
