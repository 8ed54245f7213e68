#include "strategy_ledger.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include "issuance.hpp"
#include <spdlog/spdlog.h>

StrategyLedger::StrategyLedger(std::shared_ptr<YieldStrategy> strategy)
    : strategy_(strategy)
{
    if (!strategy_) {
        throw VaultError(ErrorCode::StrategyError, "no yield strategy provided");
    }
}

void StrategyLedger::attach(VaultComposition& composition) const {
    StrategyDelegation delegation;
    delegation.strategy_id = strategy_->strategy_id();
    delegation.vault_name = composition.name;
    composition.strategy = delegation;
    spdlog::info("Strategy {} attached to vault {}", delegation.strategy_id, composition.name);
}

StrategyDelegation& StrategyLedger::bound_delegation(VaultComposition& composition) const {
    if (!composition.strategy.has_value()) {
        throw VaultError(ErrorCode::StrategyError,
                         "vault " + composition.name + " has no strategy delegation");
    }
    
    auto& delegation = *composition.strategy;
    if (delegation.vault_name != composition.name ||
        delegation.strategy_id != strategy_->strategy_id()) {
        spdlog::warn("Delegation {} bound to {} used for vault {}",
                     delegation.strategy_id, delegation.vault_name, composition.name);
        throw VaultError(ErrorCode::Unauthorized,
                         "strategy delegation is not bound to vault " + composition.name);
    }
    return delegation;
}

uint64_t StrategyLedger::observe_value() {
    try {
        return strategy_->current_value();
    } catch (const VaultError&) {
        throw;
    } catch (const std::exception& e) {
        throw VaultError(ErrorCode::StrategyError, e.what());
    }
}

void StrategyLedger::delegate(VaultComposition& composition, uint64_t amount) {
    auto& delegation = bound_delegation(composition);
    
    if (amount == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "delegation amount must be greater than 0");
    }
    uint64_t new_principal = CheckedMath::add_u64(delegation.principal, amount);
    
    try {
        strategy_->stake(amount);
    } catch (const VaultError&) {
        throw;
    } catch (const std::exception& e) {
        throw VaultError(ErrorCode::StrategyError, std::string("stake failed: ") + e.what());
    }
    uint64_t value = observe_value();
    
    delegation.principal = new_principal;
    delegation.current_value = value;
    
    spdlog::info("Delegated {} to {}: principal={}, value={}",
                 amount, delegation.strategy_id, delegation.principal, delegation.current_value);
}

UnwindResult StrategyLedger::undelegate(VaultComposition& composition, uint64_t fraction) {
    auto& delegation = bound_delegation(composition);
    
    if (fraction == 0 || fraction > kFractionScale) {
        throw VaultError(ErrorCode::InvalidAmount,
                         "unwind fraction must be in (0, " + std::to_string(kFractionScale) + "]");
    }
    
    UnwindResult result;
    result.fraction = fraction;
    
    uint64_t observed = observe_value();
    result.requested_amount = IssuanceCalculator::proportional_amount(observed, fraction);
    result.principal_released = IssuanceCalculator::proportional_amount(delegation.principal,
                                                                        fraction);
    
    uint64_t value_after = observed;
    if (result.requested_amount > 0) {
        try {
            result.received_amount = strategy_->unstake(result.requested_amount);
        } catch (const VaultError&) {
            throw;
        } catch (const std::exception& e) {
            throw VaultError(ErrorCode::StrategyError, std::string("unstake failed: ") + e.what());
        }
        value_after = observe_value();
    }
    
    result.yield_amount = IssuanceCalculator::yield_component(result.received_amount,
                                                              delegation.principal, fraction);
    
    delegation.principal = CheckedMath::sub_u64(delegation.principal, result.principal_released);
    delegation.current_value = value_after;
    
    spdlog::info("Undelegated {} from {}: received={}, principal released={}, yield={}",
                 result.requested_amount, delegation.strategy_id, result.received_amount,
                 result.principal_released, result.yield_amount);
    
    return result;
}

uint64_t StrategyLedger::refresh(VaultComposition& composition) {
    auto& delegation = bound_delegation(composition);
    delegation.current_value = observe_value();
    return delegation.current_value;
}
