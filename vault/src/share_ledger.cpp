#include "share_ledger.hpp"
#include "checked_math.hpp"
#include "errors.hpp"

ShareLedger::ShareLedger(const std::map<std::string, uint64_t>& balances) {
    for (const auto& [holder, shares] : balances) {
        if (shares == 0) continue;
        balances_[holder] = shares;
        total_supply_ = CheckedMath::add_u64(total_supply_, shares);
    }
}

uint64_t ShareLedger::balance_of(const std::string& holder) const {
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

void ShareLedger::mint(const std::string& holder, uint64_t shares) {
    if (shares == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "cannot mint zero shares");
    }
    
    uint64_t new_supply = CheckedMath::add_u64(total_supply_, shares);
    uint64_t new_balance = CheckedMath::add_u64(balance_of(holder), shares);
    
    total_supply_ = new_supply;
    balances_[holder] = new_balance;
}

void ShareLedger::burn(const std::string& holder, uint64_t shares) {
    uint64_t balance = balance_of(holder);
    if (shares == 0 || shares > balance || shares > total_supply_) {
        throw VaultError(ErrorCode::InsufficientShares,
                         holder + " holds " + std::to_string(balance) + " shares, cannot burn " +
                         std::to_string(shares));
    }
    
    total_supply_ -= shares;
    if (balance == shares) {
        balances_.erase(holder);
    } else {
        balances_[holder] = balance - shares;
    }
}
