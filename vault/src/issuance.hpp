#pragma once

#include "composition.hpp"
#include "price_normalizer.hpp"
#include <cstdint>
#include <vector>

// Precision of withdrawal fractions (1_000_000 == 100%)
constexpr uint64_t kFractionScale = 1000000;

struct AssetSubAllocation {
    size_t asset_index = 0;
    uint64_t base_amount = 0;   // slice of the deposit, base currency units
    int64_t usd_micro = 0;
    uint64_t asset_amount = 0;  // expected amount in the asset's units
    bool delegated = false;     // routed to the yield strategy
};

struct DepositAllocation {
    int64_t deposit_usd_micro = 0;
    std::vector<AssetSubAllocation> allocations;
    uint64_t delegated_amount = 0;
};

struct AssetRelease {
    size_t asset_index = 0;
    uint64_t amount = 0;
    int64_t usd_micro = 0;
};

struct WithdrawalQuote {
    uint64_t shares_to_burn = 0;
    uint64_t fraction = 0;
    std::vector<AssetRelease> releases;
    int64_t release_usd_micro = 0;
    uint64_t settlement_amount = 0;
    
    // Delegated position, zero without a strategy
    uint64_t strategy_unwind_amount = 0;
    uint64_t strategy_principal_share = 0;
};

class IssuanceCalculator {
public:
    static uint64_t shares_to_mint(int64_t deposit_usd_micro, int64_t share_price_usd_micro);
    
    // Splits a base currency deposit across assets by target weight
    static DepositAllocation allocate_deposit(const VaultComposition& composition,
                                              uint64_t deposit_amount,
                                              const NormalizedPrice& base_price,
                                              const std::vector<NormalizedPrice>& prices);
    
    static uint64_t withdrawal_fraction(uint64_t shares_to_burn, uint64_t total_shares,
                                        uint64_t holder_balance);
    
    static uint64_t proportional_amount(uint64_t amount, uint64_t fraction);
    
    static WithdrawalQuote quote_withdrawal(const VaultComposition& composition,
                                            const std::vector<uint64_t>& balances,
                                            const std::vector<NormalizedPrice>& prices,
                                            const NormalizedPrice& base_price,
                                            uint64_t shares_to_burn,
                                            uint64_t total_shares,
                                            uint64_t holder_balance);
    
    // received - principal share; negative when the strategy lost value
    static int64_t yield_component(uint64_t received_amount, uint64_t delegated_principal,
                                   uint64_t fraction);
};
