#include "memory_store.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

uint64_t InMemoryBalanceStore::get_balance(const std::string& vault_name,
                                           const std::string& asset_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find({vault_name, asset_id});
    return it == balances_.end() ? 0 : it->second;
}

void InMemoryBalanceStore::set_balance(const std::string& vault_name,
                                       const std::string& asset_id, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[{vault_name, asset_id}] = amount;
}

void InMemoryBalanceStore::credit(const std::string& vault_name,
                                  const std::string& asset_id, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& balance = balances_[{vault_name, asset_id}];
    balance = CheckedMath::add_u64(balance, amount);
}

void InMemoryBalanceStore::debit(const std::string& vault_name,
                                 const std::string& asset_id, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& balance = balances_[{vault_name, asset_id}];
    if (balance < amount) {
        throw VaultError(ErrorCode::InsufficientBalance,
                         asset_id + " balance " + std::to_string(balance) +
                         " below " + std::to_string(amount));
    }
    balance -= amount;
}

SimulatedSwapExecutor::SimulatedSwapExecutor(std::shared_ptr<PriceOracle> oracle,
                                             std::function<int64_t()> clock,
                                             std::shared_ptr<InMemoryBalanceStore> balances)
    : oracle_(oracle)
    , clock_(clock)
    , balances_(balances)
{}

uint64_t SimulatedSwapExecutor::execute(const VaultComposition& composition,
                                        const SwapInstruction& swap) {
    if (swap.from_asset >= composition.assets.size() ||
        swap.to_asset >= composition.assets.size()) {
        throw VaultError(ErrorCode::AssetNotFound, "swap references an unknown asset index");
    }
    
    const auto& from = composition.assets[swap.from_asset];
    const auto& to = composition.assets[swap.to_asset];
    
    auto from_price = oracle_->price_feed(composition.oracle_source, from.oracle_feed, clock_());
    auto to_price = oracle_->price_feed(composition.oracle_source, to.oracle_feed, clock_());
    
    uint64_t amount_out = PriceNormalizer::convert_amount(swap.amount_in, from_price, from.decimals,
                                                          to_price, to.decimals);
    
    if (amount_out == 0 || amount_out < swap.min_amount_out) {
        throw VaultError(ErrorCode::SwapFailed,
                         "output " + std::to_string(amount_out) + " below minimum " +
                         std::to_string(swap.min_amount_out));
    }
    
    if (balances_) {
        balances_->debit(composition.name, from.asset_id, swap.amount_in);
        balances_->credit(composition.name, to.asset_id, amount_out);
    }
    
    spdlog::debug("Simulated swap {} {} -> {} {}", swap.amount_in, from.symbol,
                  amount_out, to.symbol);
    return amount_out;
}
