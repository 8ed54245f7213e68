#pragma once

#include "price_normalizer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

struct DriftEntry {
    size_t asset_index = 0;
    int64_t current_usd = 0;
    int64_t target_usd = 0;
    int32_t current_weight = 0;
    int32_t target_weight = 0;
    int32_t drift = 0;
    bool exceeds_threshold = false;
    bool tradable = true;
};

// Value an asset holds outside the pool's token balances, such as a yield
// strategy position. It counts toward drift but is never swapped.
struct ExternalHolding {
    size_t asset_index = 0;
    int64_t usd_micro = 0;
    
    bool operator==(const ExternalHolding& other) const {
        return asset_index == other.asset_index && usd_micro == other.usd_micro;
    }
};

struct DriftReport {
    std::vector<DriftEntry> entries;
    int64_t total_usd = 0;
    int32_t threshold_percent = 0;
    bool needs_rebalance = false;
};

struct SwapInstruction {
    size_t from_asset = 0;
    size_t to_asset = 0;
    uint64_t amount_in = 0;
    uint64_t min_amount_out = 0;
    int64_t usd_value = 0;
    
    bool operator==(const SwapInstruction& other) const;
};

using SwapPlan = std::vector<SwapInstruction>;

struct RebalancePolicy {
    int32_t threshold_percent = 5;
    size_t max_swaps = 6;
    uint32_t slippage_bps = 100;        // min_amount_out = 99% of expected
    int64_t min_swap_usd_micro = 1000000;
};

class DriftRebalancer {
public:
    static DriftReport evaluate_drift(const std::vector<uint64_t>& balances,
                                      const std::vector<NormalizedPrice>& prices,
                                      const std::vector<uint8_t>& weights,
                                      const std::vector<uint8_t>& decimals,
                                      int32_t threshold_percent,
                                      const std::optional<ExternalHolding>& external = std::nullopt);
    
    // Greedy excess -> deficit matching over tradable assets.
    // Pure: equal inputs give equal plans.
    static SwapPlan plan_rebalance(const DriftReport& report,
                                   const std::vector<NormalizedPrice>& prices,
                                   const std::vector<uint8_t>& decimals,
                                   const RebalancePolicy& policy = RebalancePolicy{});
};
