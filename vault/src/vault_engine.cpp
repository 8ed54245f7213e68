#include "vault_engine.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

VaultEngine::VaultEngine(const EngineCollaborators& collaborators, const RebalancePolicy& policy)
    : collab_(collaborators)
    , policy_(policy)
    , coordinator_(collaborators.confidential)
{
    if (!collab_.oracle || !collab_.balances || !collab_.swaps) {
        throw std::invalid_argument("VaultEngine requires oracle, balance store and swap executor");
    }
}

std::vector<uint64_t> VaultEngine::read_balances(const VaultComposition& composition) {
    std::vector<uint64_t> balances;
    balances.reserve(composition.assets.size());
    for (const auto& asset : composition.assets) {
        balances.push_back(collab_.balances->get_balance(composition.name, asset.asset_id));
    }
    return balances;
}

StrategyLedger VaultEngine::strategy_ledger() const {
    if (!collab_.strategy) {
        throw VaultError(ErrorCode::StrategyError, "no yield strategy configured");
    }
    return StrategyLedger(collab_.strategy);
}

void VaultEngine::refresh_strategy(VaultComposition& composition) {
    if (composition.strategy.has_value()) {
        strategy_ledger().refresh(composition);
    }
}

void VaultEngine::require_owner(const VaultComposition& composition, const std::string& caller) {
    if (caller != composition.owner) {
        spdlog::warn("Rejected {} on vault {}: not the owner", caller, composition.name);
        throw VaultError(ErrorCode::Unauthorized, caller + " does not own vault " + composition.name);
    }
}

ValuationSnapshot VaultEngine::snapshot(VaultComposition& composition, const ShareLedger& shares,
                                        int64_t now) {
    VaultComposition working = composition;
    refresh_strategy(working);
    
    auto prices = collab_.oracle->price_vault(working, now);
    auto balances = read_balances(working);
    auto result = Valuator::value_vault(working, balances, prices.assets, prices.base,
                                        shares.total_supply());
    
    composition = std::move(working);
    return result;
}

DepositReceipt VaultEngine::deposit(VaultComposition& composition, ShareLedger& shares,
                                    const std::string& holder, uint64_t amount, int64_t now) {
    if (amount == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "deposit amount must be greater than 0");
    }
    composition.validate();
    
    VaultComposition working = composition;
    ShareLedger working_shares = shares;
    refresh_strategy(working);
    
    auto prices = collab_.oracle->price_vault(working, now);
    auto balances = read_balances(working);
    
    DepositReceipt receipt;
    receipt.holder = holder;
    receipt.amount = amount;
    receipt.base_price = prices.base;
    receipt.before = Valuator::value_vault(working, balances, prices.assets, prices.base,
                                           working_shares.total_supply());
    receipt.allocation = IssuanceCalculator::allocate_deposit(working, amount, prices.base,
                                                              prices.assets);
    receipt.shares_minted = IssuanceCalculator::shares_to_mint(
        receipt.allocation.deposit_usd_micro, receipt.before.share_price_usd_micro);
    
    if (receipt.shares_minted == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "deposit too small to mint a share unit");
    }
    
    if (receipt.allocation.delegated_amount > 0) {
        strategy_ledger().delegate(working, receipt.allocation.delegated_amount);
    }
    working_shares.mint(holder, receipt.shares_minted);
    
    receipt.tvl_after = CheckedMath::add(receipt.before.tvl_usd_micro,
                                         receipt.allocation.deposit_usd_micro);
    receipt.share_price_after = Valuator::compute_share_price(receipt.tvl_after,
                                                              working_shares.total_supply());
    
    composition = std::move(working);
    shares = std::move(working_shares);
    
    spdlog::info("Deposit into {}: holder={}, amount={}, usd={}, shares={}",
                 composition.name, holder, amount, receipt.allocation.deposit_usd_micro,
                 receipt.shares_minted);
    return receipt;
}

WithdrawalReceipt VaultEngine::withdraw(VaultComposition& composition, ShareLedger& shares,
                                        const std::string& holder, uint64_t shares_to_burn,
                                        int64_t now) {
    VaultComposition working = composition;
    ShareLedger working_shares = shares;
    refresh_strategy(working);
    
    auto prices = collab_.oracle->price_vault(working, now);
    auto balances = read_balances(working);
    
    WithdrawalReceipt receipt;
    receipt.holder = holder;
    receipt.tvl_before = Valuator::compute_tvl(balances, prices.assets, working.decimals(),
                                               Valuator::strategy_value_usd(working, prices.base));
    receipt.quote = IssuanceCalculator::quote_withdrawal(working, balances, prices.assets,
                                                         prices.base, shares_to_burn,
                                                         working_shares.total_supply(),
                                                         working_shares.balance_of(holder));
    
    receipt.total_settlement = receipt.quote.settlement_amount;
    if (working.strategy.has_value() &&
        (working.strategy->principal > 0 || working.strategy->current_value > 0)) {
        receipt.unwind = strategy_ledger().undelegate(working, receipt.quote.fraction);
        receipt.total_settlement = CheckedMath::add_u64(receipt.total_settlement,
                                                        receipt.unwind->received_amount);
    }
    
    working_shares.burn(holder, shares_to_burn);
    
    composition = std::move(working);
    shares = std::move(working_shares);
    
    spdlog::info("Withdrawal from {}: holder={}, shares={}, fraction={}, settlement={}",
                 composition.name, holder, shares_to_burn, receipt.quote.fraction,
                 receipt.total_settlement);
    return receipt;
}

RebalanceOutcome VaultEngine::rebalance(const VaultComposition& composition,
                                        const std::string& caller, int64_t now, bool execute) {
    require_owner(composition, caller);
    
    VaultComposition working = composition;
    refresh_strategy(working);
    
    auto prices = collab_.oracle->price_vault(working, now);
    auto balances = read_balances(working);
    
    RebalancingInput input;
    input.balances = balances;
    for (const auto& price : prices.assets) {
        input.prices_usd_micro.push_back(price.usd_micro);
    }
    input.weights = working.weights();
    input.decimals = working.decimals();
    input.threshold_percent = policy_.threshold_percent;
    
    // The strategy position is the delegated asset's holding
    auto delegated = working.delegated_index();
    if (working.strategy.has_value() && delegated.has_value()) {
        ExternalHolding holding;
        holding.asset_index = *delegated;
        holding.usd_micro = Valuator::strategy_value_usd(working, prices.base);
        input.strategy_holding = holding;
    }
    
    auto decision = coordinator_.decide(input, policy_);
    
    RebalanceOutcome outcome;
    outcome.report = std::move(decision.report);
    outcome.plan = std::move(decision.plan);
    
    if (!execute || !outcome.report.needs_rebalance) {
        spdlog::info("Rebalance of {}: needs={}, planned {} swaps, not executed",
                     composition.name, outcome.report.needs_rebalance, outcome.plan.size());
        return outcome;
    }
    
    for (const auto& swap : outcome.plan) {
        uint64_t realized = collab_.swaps->execute(composition, swap);
        if (realized < swap.min_amount_out) {
            throw VaultError(ErrorCode::SwapFailed,
                             "realized " + std::to_string(realized) + " below minimum " +
                             std::to_string(swap.min_amount_out));
        }
        outcome.realized_outputs.push_back(realized);
    }
    outcome.executed = true;
    
    spdlog::info("Rebalanced {}: {} swaps executed, tvl={}",
                 composition.name, outcome.realized_outputs.size(), outcome.report.total_usd);
    return outcome;
}

void VaultEngine::set_strategy(VaultComposition& composition, const std::string& caller) {
    require_owner(composition, caller);
    
    if (!composition.delegated_index().has_value()) {
        throw VaultError(ErrorCode::StrategyError,
                         "vault " + composition.name + " has no delegated asset");
    }
    if (composition.strategy.has_value() &&
        (composition.strategy->principal > 0 || composition.strategy->current_value > 0)) {
        throw VaultError(ErrorCode::StrategyError, "existing delegation still holds value");
    }
    
    strategy_ledger().attach(composition);
}

void VaultEngine::remove_strategy(VaultComposition& composition, const std::string& caller) {
    require_owner(composition, caller);
    
    if (!composition.strategy.has_value()) {
        return;
    }
    // Residual value is retained yield of the remaining holders
    if (composition.strategy->principal > 0 || composition.strategy->current_value > 0) {
        throw VaultError(ErrorCode::StrategyError,
                         "delegation still holds principal " +
                         std::to_string(composition.strategy->principal) + " and value " +
                         std::to_string(composition.strategy->current_value));
    }
    
    spdlog::info("Strategy {} detached from vault {}",
                 composition.strategy->strategy_id, composition.name);
    composition.strategy.reset();
}
