#pragma once

#include "rebalancer.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

// Everything a rebalancing decision depends on. Prices are USD micro.
struct RebalancingInput {
    std::vector<uint64_t> balances;
    std::vector<int64_t> prices_usd_micro;
    std::vector<uint8_t> weights;
    std::vector<uint8_t> decimals;
    int32_t threshold_percent = 5;
    std::optional<ExternalHolding> strategy_holding;
};

struct RebalancingResult {
    bool needs_rebalance = false;
    std::vector<int32_t> drifts;
    int64_t total_tvl = 0;
    SwapPlan swaps;
    
    bool operator==(const RebalancingResult& other) const;
    bool operator!=(const RebalancingResult& other) const { return !(*this == other); }
};

// A compute backend that may evaluate the rebalance away from this process
class ConfidentialCompute {
public:
    virtual ~ConfidentialCompute() = default;
    
    virtual RebalancingResult compute_rebalancing(const RebalancingInput& input,
                                                  const RebalancePolicy& policy) = 0;
};

class PlaintextCompute : public ConfidentialCompute {
public:
    RebalancingResult compute_rebalancing(const RebalancingInput& input,
                                          const RebalancePolicy& policy) override;
    
    static std::vector<NormalizedPrice> input_prices(const RebalancingInput& input);
};

struct RebalanceDecision {
    DriftReport report;
    SwapPlan plan;
};

// Computes the decision in plaintext and, when a confidential backend is
// configured, requires it to agree exactly.
class RebalanceCoordinator {
public:
    explicit RebalanceCoordinator(std::shared_ptr<ConfidentialCompute> confidential = nullptr);
    
    RebalanceDecision decide(const RebalancingInput& input, const RebalancePolicy& policy);
    
    bool has_confidential() const { return confidential_ != nullptr; }
    
private:
    std::shared_ptr<ConfidentialCompute> confidential_;
};
