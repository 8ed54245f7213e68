#pragma once

#include "collaborators.hpp"
#include "price_oracle.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

class InMemoryBalanceStore : public BalanceStore {
public:
    uint64_t get_balance(const std::string& vault_name, const std::string& asset_id) override;
    
    void set_balance(const std::string& vault_name, const std::string& asset_id, uint64_t amount);
    void credit(const std::string& vault_name, const std::string& asset_id, uint64_t amount);
    void debit(const std::string& vault_name, const std::string& asset_id, uint64_t amount);
    
private:
    std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, uint64_t> balances_;
};

// Devnet swap: fills at oracle prices with no fees. When a balance store is
// given the swap also moves the balances.
class SimulatedSwapExecutor : public SwapExecutor {
public:
    SimulatedSwapExecutor(std::shared_ptr<PriceOracle> oracle,
                          std::function<int64_t()> clock,
                          std::shared_ptr<InMemoryBalanceStore> balances = nullptr);
    
    uint64_t execute(const VaultComposition& composition, const SwapInstruction& swap) override;
    
private:
    std::shared_ptr<PriceOracle> oracle_;
    std::function<int64_t()> clock_;
    std::shared_ptr<InMemoryBalanceStore> balances_;
};
