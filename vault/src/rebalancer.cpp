#include "rebalancer.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include "valuation.hpp"
#include <algorithm>
#include <cstdlib>
#include <spdlog/spdlog.h>

bool SwapInstruction::operator==(const SwapInstruction& other) const {
    return from_asset == other.from_asset &&
           to_asset == other.to_asset &&
           amount_in == other.amount_in &&
           min_amount_out == other.min_amount_out &&
           usd_value == other.usd_value;
}

DriftReport DriftRebalancer::evaluate_drift(const std::vector<uint64_t>& balances,
                                            const std::vector<NormalizedPrice>& prices,
                                            const std::vector<uint8_t>& weights,
                                            const std::vector<uint8_t>& decimals,
                                            int32_t threshold_percent,
                                            const std::optional<ExternalHolding>& external) {
    if (weights.size() != balances.size()) {
        throw VaultError(ErrorCode::InvalidAssetCount,
                         "weights must match balances");
    }
    
    DriftReport report;
    report.threshold_percent = threshold_percent;
    
    auto values = Valuator::asset_values(balances, prices, decimals);
    if (external.has_value()) {
        if (external->asset_index >= values.size()) {
            throw VaultError(ErrorCode::AssetNotFound,
                             "external holding for asset " +
                             std::to_string(external->asset_index));
        }
        if (external->usd_micro < 0) {
            throw VaultError(ErrorCode::InvalidAmount, "negative external holding");
        }
        values[external->asset_index] = CheckedMath::add(values[external->asset_index],
                                                         external->usd_micro);
    }
    for (int64_t value : values) {
        report.total_usd = CheckedMath::add(report.total_usd, value);
    }
    
    for (size_t i = 0; i < values.size(); i++) {
        DriftEntry entry;
        entry.asset_index = i;
        entry.current_usd = values[i];
        entry.target_weight = weights[i];
        entry.tradable = !external.has_value() || external->asset_index != i;
        
        if (report.total_usd == 0) {
            // Empty pool: nothing to compare against
            report.entries.push_back(entry);
            continue;
        }
        
        entry.target_usd = CheckedMath::mul_div(report.total_usd, weights[i], 100);
        entry.current_weight = static_cast<int32_t>(
            CheckedMath::mul_div(values[i], 100, report.total_usd));
        entry.drift = entry.current_weight - entry.target_weight;
        entry.exceeds_threshold = std::abs(entry.drift) > threshold_percent;
        
        spdlog::debug("Asset {}: target={}%, current={}%, drift={}{}",
                      i, entry.target_weight, entry.current_weight, entry.drift,
                      entry.exceeds_threshold ? " (exceeds)" : "");
        
        if (entry.exceeds_threshold) {
            report.needs_rebalance = true;
        }
        report.entries.push_back(entry);
    }
    
    return report;
}

SwapPlan DriftRebalancer::plan_rebalance(const DriftReport& report,
                                         const std::vector<NormalizedPrice>& prices,
                                         const std::vector<uint8_t>& decimals,
                                         const RebalancePolicy& policy) {
    SwapPlan plan;
    if (!report.needs_rebalance || report.total_usd == 0) {
        return plan;
    }
    if (prices.size() != report.entries.size() || decimals.size() != report.entries.size()) {
        throw VaultError(ErrorCode::InvalidAssetCount,
                         "prices and decimals must match the drift report");
    }
    
    struct Leg {
        size_t index;
        int64_t remaining;
    };
    std::vector<Leg> excess;
    std::vector<Leg> deficit;
    
    for (const auto& entry : report.entries) {
        if (!entry.tradable) {
            continue;
        }
        if (entry.current_usd > entry.target_usd) {
            excess.push_back({entry.asset_index, entry.current_usd - entry.target_usd});
        } else if (entry.current_usd < entry.target_usd) {
            deficit.push_back({entry.asset_index, entry.target_usd - entry.current_usd});
        }
    }
    
    for (auto& from : excess) {
        for (auto& to : deficit) {
            if (plan.size() >= policy.max_swaps) {
                spdlog::debug("Swap plan reached {} swaps, stopping", policy.max_swaps);
                return plan;
            }
            if (from.remaining == 0) break;
            if (to.remaining == 0) continue;
            
            int64_t swap_usd = std::min(from.remaining, to.remaining);
            if (swap_usd <= policy.min_swap_usd_micro) {
                continue;
            }
            
            uint64_t amount_in = PriceNormalizer::usd_to_tokens(prices[from.index], swap_usd,
                                                                decimals[from.index]);
            if (amount_in == 0) {
                continue;
            }
            
            uint64_t expected_out = PriceNormalizer::convert_amount(
                amount_in, prices[from.index], decimals[from.index],
                prices[to.index], decimals[to.index]);
            
            SwapInstruction swap;
            swap.from_asset = from.index;
            swap.to_asset = to.index;
            swap.amount_in = amount_in;
            swap.min_amount_out = CheckedMath::mul_div_u64(
                expected_out, 10000 - std::min<uint32_t>(policy.slippage_bps, 10000), 10000);
            swap.usd_value = swap_usd;
            plan.push_back(swap);
            
            spdlog::debug("Planned swap ${} from asset {} to asset {}: in={}, min_out={}",
                          swap_usd / kUsdMicro, from.index, to.index,
                          amount_in, swap.min_amount_out);
            
            from.remaining -= swap_usd;
            to.remaining -= swap_usd;
        }
    }
    
    return plan;
}
