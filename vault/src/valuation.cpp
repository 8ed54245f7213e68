#include "valuation.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

std::vector<int64_t> Valuator::asset_values(const std::vector<uint64_t>& balances,
                                            const std::vector<NormalizedPrice>& prices,
                                            const std::vector<uint8_t>& decimals) {
    if (balances.size() != prices.size() || balances.size() != decimals.size()) {
        throw VaultError(ErrorCode::InvalidAssetCount,
                         "balances, prices and decimals must have the same length");
    }
    
    std::vector<int64_t> values;
    values.reserve(balances.size());
    for (size_t i = 0; i < balances.size(); i++) {
        values.push_back(PriceNormalizer::tokens_to_usd(prices[i], balances[i], decimals[i]));
    }
    return values;
}

int64_t Valuator::compute_tvl(const std::vector<uint64_t>& balances,
                              const std::vector<NormalizedPrice>& prices,
                              const std::vector<uint8_t>& decimals,
                              int64_t strategy_usd_micro) {
    int64_t tvl = 0;
    for (int64_t value : asset_values(balances, prices, decimals)) {
        tvl = CheckedMath::add(tvl, value);
    }
    return CheckedMath::add(tvl, strategy_usd_micro);
}

int64_t Valuator::compute_share_price(int64_t tvl_usd_micro, uint64_t total_shares) {
    if (total_shares == 0) {
        return kBootstrapSharePrice;
    }
    
    if (tvl_usd_micro <= 0) {
        spdlog::warn("TVL is {} while {} shares are outstanding", tvl_usd_micro, total_shares);
        throw VaultError(ErrorCode::ImpairedVault,
                         "TVL " + std::to_string(tvl_usd_micro) + " with " +
                         std::to_string(total_shares) + " shares outstanding");
    }
    
    // tvl * 10^9 / total_shares / 10^3
    wide_int scaled = static_cast<wide_int>(tvl_usd_micro) * kShareScale;
    scaled /= static_cast<wide_int>(total_shares);
    scaled /= 1000;
    return CheckedMath::narrow_i64(scaled);
}

int64_t Valuator::strategy_value_usd(const VaultComposition& composition,
                                     const NormalizedPrice& base_price) {
    if (!composition.strategy.has_value()) {
        return 0;
    }
    return PriceNormalizer::tokens_to_usd(base_price, composition.strategy->current_value,
                                          composition.base.decimals);
}

ValuationSnapshot Valuator::value_vault(const VaultComposition& composition,
                                        const std::vector<uint64_t>& balances,
                                        const std::vector<NormalizedPrice>& prices,
                                        const NormalizedPrice& base_price,
                                        uint64_t total_shares) {
    if (balances.size() != composition.assets.size()) {
        throw VaultError(ErrorCode::InvalidAssetCount,
                         "expected " + std::to_string(composition.assets.size()) +
                         " balances, got " + std::to_string(balances.size()));
    }
    
    ValuationSnapshot snapshot;
    snapshot.asset_usd = asset_values(balances, prices, composition.decimals());
    snapshot.strategy_usd = strategy_value_usd(composition, base_price);
    
    int64_t tvl = 0;
    for (int64_t value : snapshot.asset_usd) {
        tvl = CheckedMath::add(tvl, value);
    }
    snapshot.tvl_usd_micro = CheckedMath::add(tvl, snapshot.strategy_usd);
    snapshot.total_shares = total_shares;
    snapshot.share_price_usd_micro = compute_share_price(snapshot.tvl_usd_micro, total_shares);
    
    spdlog::debug("Vault {} TVL={} usd_micro (strategy={}), shares={}, share price={}",
                  composition.name, snapshot.tvl_usd_micro, snapshot.strategy_usd,
                  total_shares, snapshot.share_price_usd_micro);
    
    return snapshot;
}
