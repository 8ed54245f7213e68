#pragma once

#include "composition.hpp"
#include "rebalancer.hpp"
#include <cstdint>
#include <string>

struct OracleQuote {
    int64_t raw_price = 0;
    int32_t raw_exponent = 0;
    int64_t observed_at = 0;    // unix seconds
};

class OracleProvider {
public:
    virtual ~OracleProvider() = default;
    
    virtual OracleQuote get_quote(const std::string& feed_id) = 0;
    virtual bool is_healthy() { return true; }
};

// Read-only view of vault-held balances in native minor units
class BalanceStore {
public:
    virtual ~BalanceStore() = default;
    
    virtual uint64_t get_balance(const std::string& vault_name, const std::string& asset_id) = 0;
};

class SwapExecutor {
public:
    virtual ~SwapExecutor() = default;
    
    // Returns the realized output or throws
    virtual uint64_t execute(const VaultComposition& composition, const SwapInstruction& swap) = 0;
};

class YieldStrategy {
public:
    virtual ~YieldStrategy() = default;
    
    virtual std::string strategy_id() const = 0;
    virtual void stake(uint64_t amount) = 0;
    virtual uint64_t unstake(uint64_t amount) = 0;
    virtual uint64_t current_value() = 0;
};
