#pragma once

#include "collaborators.hpp"
#include "composition.hpp"
#include "confidential.hpp"
#include "issuance.hpp"
#include "price_oracle.hpp"
#include "rebalancer.hpp"
#include "share_ledger.hpp"
#include "strategy_ledger.hpp"
#include "valuation.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct DepositReceipt {
    std::string holder;
    uint64_t amount = 0;
    NormalizedPrice base_price;
    ValuationSnapshot before;
    DepositAllocation allocation;
    uint64_t shares_minted = 0;
    int64_t tvl_after = 0;
    int64_t share_price_after = 0;
};

struct WithdrawalReceipt {
    std::string holder;
    int64_t tvl_before = 0;
    WithdrawalQuote quote;
    std::optional<UnwindResult> unwind;
    uint64_t total_settlement = 0;  // asset settlement plus strategy proceeds
};

struct RebalanceOutcome {
    DriftReport report;
    SwapPlan plan;
    std::vector<uint64_t> realized_outputs;
    bool executed = false;
};

struct EngineCollaborators {
    std::shared_ptr<PriceOracle> oracle;
    std::shared_ptr<BalanceStore> balances;
    std::shared_ptr<SwapExecutor> swaps;
    std::shared_ptr<YieldStrategy> strategy;                // optional
    std::shared_ptr<ConfidentialCompute> confidential;      // optional
};

// Runs vault operations against the collaborators. Composition and share
// ledger are only modified once every step of an operation succeeded.
class VaultEngine {
public:
    VaultEngine(const EngineCollaborators& collaborators, const RebalancePolicy& policy);
    
    const RebalancePolicy& policy() const { return policy_; }
    
    ValuationSnapshot snapshot(VaultComposition& composition, const ShareLedger& shares,
                               int64_t now);
    
    DepositReceipt deposit(VaultComposition& composition, ShareLedger& shares,
                           const std::string& holder, uint64_t amount, int64_t now);
    
    WithdrawalReceipt withdraw(VaultComposition& composition, ShareLedger& shares,
                               const std::string& holder, uint64_t shares_to_burn,
                               int64_t now);
    
    // Plans and, when execute is set and drift exceeds the threshold, runs
    // the swaps. Only the vault owner may rebalance.
    RebalanceOutcome rebalance(const VaultComposition& composition, const std::string& caller,
                               int64_t now, bool execute = true);
    
    void set_strategy(VaultComposition& composition, const std::string& caller);
    void remove_strategy(VaultComposition& composition, const std::string& caller);
    
private:
    EngineCollaborators collab_;
    RebalancePolicy policy_;
    RebalanceCoordinator coordinator_;
    
    std::vector<uint64_t> read_balances(const VaultComposition& composition);
    void refresh_strategy(VaultComposition& composition);
    StrategyLedger strategy_ledger() const;
    static void require_owner(const VaultComposition& composition, const std::string& caller);
};
