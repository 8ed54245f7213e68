#include "issuance.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include "valuation.hpp"
#include <spdlog/spdlog.h>

uint64_t IssuanceCalculator::shares_to_mint(int64_t deposit_usd_micro,
                                            int64_t share_price_usd_micro) {
    if (share_price_usd_micro <= 0) {
        throw VaultError(ErrorCode::MathOverflow,
                         "share price must be positive, got " +
                         std::to_string(share_price_usd_micro));
    }
    if (deposit_usd_micro < 0) {
        throw VaultError(ErrorCode::InvalidAmount, "negative deposit value");
    }
    
    // deposit * 10^9 / share_price / 10^3
    wide_int shares = static_cast<wide_int>(deposit_usd_micro) * kShareScale;
    shares /= share_price_usd_micro;
    shares /= 1000;
    return CheckedMath::narrow_u64(shares);
}

DepositAllocation IssuanceCalculator::allocate_deposit(const VaultComposition& composition,
                                                       uint64_t deposit_amount,
                                                       const NormalizedPrice& base_price,
                                                       const std::vector<NormalizedPrice>& prices) {
    if (deposit_amount == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "deposit must be greater than 0");
    }
    if (prices.size() != composition.assets.size()) {
        throw VaultError(ErrorCode::InvalidAssetCount,
                         "expected " + std::to_string(composition.assets.size()) +
                         " prices, got " + std::to_string(prices.size()));
    }
    
    DepositAllocation out;
    out.deposit_usd_micro = PriceNormalizer::tokens_to_usd(base_price, deposit_amount,
                                                           composition.base.decimals);
    
    for (size_t i = 0; i < composition.assets.size(); i++) {
        const auto& asset = composition.assets[i];
        
        AssetSubAllocation slice;
        slice.asset_index = i;
        slice.base_amount = CheckedMath::mul_div_u64(deposit_amount, asset.weight, 100);
        slice.usd_micro = CheckedMath::mul_div(out.deposit_usd_micro, asset.weight, 100);
        
        if (asset.role == AssetRole::Delegated && composition.strategy.has_value()) {
            slice.delegated = true;
            slice.asset_amount = slice.base_amount;
            out.delegated_amount = CheckedMath::add_u64(out.delegated_amount, slice.base_amount);
        } else if (asset.role == AssetRole::Standard) {
            slice.asset_amount = PriceNormalizer::convert_amount(
                slice.base_amount, base_price, composition.base.decimals,
                prices[i], asset.decimals);
        } else {
            // Kept in the base currency
            slice.asset_amount = slice.base_amount;
        }
        
        spdlog::debug("  {} ({}%): {} base units = {} usd_micro -> {} {}",
                      asset.symbol, asset.weight, slice.base_amount, slice.usd_micro,
                      slice.asset_amount, slice.delegated ? "delegated" : asset.symbol);
        
        out.allocations.push_back(slice);
    }
    
    return out;
}

uint64_t IssuanceCalculator::withdrawal_fraction(uint64_t shares_to_burn, uint64_t total_shares,
                                                 uint64_t holder_balance) {
    if (shares_to_burn == 0) {
        throw VaultError(ErrorCode::InvalidAmount, "shares to burn must be greater than 0");
    }
    if (shares_to_burn > total_shares) {
        throw VaultError(ErrorCode::InsufficientShares,
                         std::to_string(shares_to_burn) + " exceeds supply " +
                         std::to_string(total_shares));
    }
    if (shares_to_burn > holder_balance) {
        throw VaultError(ErrorCode::InsufficientShares,
                         std::to_string(shares_to_burn) + " exceeds holder balance " +
                         std::to_string(holder_balance));
    }
    
    return CheckedMath::mul_div_u64(shares_to_burn, kFractionScale, total_shares);
}

uint64_t IssuanceCalculator::proportional_amount(uint64_t amount, uint64_t fraction) {
    return CheckedMath::mul_div_u64(amount, fraction, kFractionScale);
}

WithdrawalQuote IssuanceCalculator::quote_withdrawal(const VaultComposition& composition,
                                                     const std::vector<uint64_t>& balances,
                                                     const std::vector<NormalizedPrice>& prices,
                                                     const NormalizedPrice& base_price,
                                                     uint64_t shares_to_burn,
                                                     uint64_t total_shares,
                                                     uint64_t holder_balance) {
    if (balances.size() != composition.assets.size() ||
        prices.size() != composition.assets.size()) {
        throw VaultError(ErrorCode::InvalidAssetCount,
                         "balances and prices must match the composition");
    }
    
    WithdrawalQuote quote;
    quote.shares_to_burn = shares_to_burn;
    quote.fraction = withdrawal_fraction(shares_to_burn, total_shares, holder_balance);
    
    for (size_t i = 0; i < composition.assets.size(); i++) {
        AssetRelease release;
        release.asset_index = i;
        release.amount = proportional_amount(balances[i], quote.fraction);
        release.usd_micro = PriceNormalizer::tokens_to_usd(prices[i], release.amount,
                                                           composition.assets[i].decimals);
        quote.release_usd_micro = CheckedMath::add(quote.release_usd_micro, release.usd_micro);
        quote.releases.push_back(release);
    }
    
    quote.settlement_amount = PriceNormalizer::usd_to_tokens(base_price, quote.release_usd_micro,
                                                             composition.base.decimals);
    
    if (composition.strategy.has_value()) {
        quote.strategy_unwind_amount = proportional_amount(composition.strategy->current_value,
                                                           quote.fraction);
        quote.strategy_principal_share = proportional_amount(composition.strategy->principal,
                                                             quote.fraction);
    }
    
    spdlog::debug("Withdrawal of {} / {} shares: fraction={}, released={} usd_micro, settlement={}",
                  shares_to_burn, total_shares, quote.fraction, quote.release_usd_micro,
                  quote.settlement_amount);
    
    return quote;
}

int64_t IssuanceCalculator::yield_component(uint64_t received_amount,
                                            uint64_t delegated_principal,
                                            uint64_t fraction) {
    uint64_t principal_share = proportional_amount(delegated_principal, fraction);
    return CheckedMath::sub(CheckedMath::to_i64(received_amount),
                            CheckedMath::to_i64(principal_share));
}
