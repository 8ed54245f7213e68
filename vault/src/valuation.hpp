#pragma once

#include "composition.hpp"
#include "price_normalizer.hpp"
#include <cstdint>
#include <vector>

// Share price used while no shares exist: $1.00
constexpr int64_t kBootstrapSharePrice = 1000000;
constexpr int64_t kShareScale = 1000000000;

struct ValuationSnapshot {
    std::vector<int64_t> asset_usd;
    int64_t strategy_usd = 0;
    int64_t tvl_usd_micro = 0;
    uint64_t total_shares = 0;
    int64_t share_price_usd_micro = 0;
};

class Valuator {
public:
    static std::vector<int64_t> asset_values(const std::vector<uint64_t>& balances,
                                             const std::vector<NormalizedPrice>& prices,
                                             const std::vector<uint8_t>& decimals);
    
    static int64_t compute_tvl(const std::vector<uint64_t>& balances,
                               const std::vector<NormalizedPrice>& prices,
                               const std::vector<uint8_t>& decimals,
                               int64_t strategy_usd_micro = 0);
    
    // $1.00 while total_shares == 0; ImpairedVault if tvl <= 0 with shares out
    static int64_t compute_share_price(int64_t tvl_usd_micro, uint64_t total_shares);
    
    // Value of the delegated position, priced in the base currency
    static int64_t strategy_value_usd(const VaultComposition& composition,
                                      const NormalizedPrice& base_price);
    
    static ValuationSnapshot value_vault(const VaultComposition& composition,
                                         const std::vector<uint64_t>& balances,
                                         const std::vector<NormalizedPrice>& prices,
                                         const NormalizedPrice& base_price,
                                         uint64_t total_shares);
};
