#include "confidential.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

bool RebalancingResult::operator==(const RebalancingResult& other) const {
    return needs_rebalance == other.needs_rebalance &&
           drifts == other.drifts &&
           total_tvl == other.total_tvl &&
           swaps == other.swaps;
}

std::vector<NormalizedPrice> PlaintextCompute::input_prices(const RebalancingInput& input) {
    std::vector<NormalizedPrice> prices;
    prices.reserve(input.prices_usd_micro.size());
    for (int64_t usd : input.prices_usd_micro) {
        prices.push_back(PriceNormalizer::normalize(usd, -kUsdDecimals));
    }
    return prices;
}

RebalancingResult PlaintextCompute::compute_rebalancing(const RebalancingInput& input,
                                                        const RebalancePolicy& policy) {
    auto prices = input_prices(input);
    auto report = DriftRebalancer::evaluate_drift(input.balances, prices, input.weights,
                                                  input.decimals, input.threshold_percent,
                                                  input.strategy_holding);
    
    RebalancingResult result;
    result.needs_rebalance = report.needs_rebalance;
    result.total_tvl = report.total_usd;
    for (const auto& entry : report.entries) {
        result.drifts.push_back(entry.drift);
    }
    result.swaps = DriftRebalancer::plan_rebalance(report, prices, input.decimals, policy);
    return result;
}

RebalanceCoordinator::RebalanceCoordinator(std::shared_ptr<ConfidentialCompute> confidential)
    : confidential_(confidential)
{}

RebalanceDecision RebalanceCoordinator::decide(const RebalancingInput& input,
                                               const RebalancePolicy& policy) {
    auto prices = PlaintextCompute::input_prices(input);
    
    RebalanceDecision decision;
    decision.report = DriftRebalancer::evaluate_drift(input.balances, prices, input.weights,
                                                      input.decimals, input.threshold_percent,
                                                      input.strategy_holding);
    decision.plan = DriftRebalancer::plan_rebalance(decision.report, prices, input.decimals,
                                                    policy);
    
    if (!confidential_) {
        return decision;
    }
    
    RebalancingResult expected;
    expected.needs_rebalance = decision.report.needs_rebalance;
    expected.total_tvl = decision.report.total_usd;
    for (const auto& entry : decision.report.entries) {
        expected.drifts.push_back(entry.drift);
    }
    expected.swaps = decision.plan;
    
    RebalancingResult remote = confidential_->compute_rebalancing(input, policy);
    if (remote != expected) {
        spdlog::error("Confidential rebalance disagrees: tvl {} vs {}, {} vs {} swaps",
                      remote.total_tvl, expected.total_tvl,
                      remote.swaps.size(), expected.swaps.size());
        throw VaultError(ErrorCode::ComputationMismatch,
                         "confidential result differs from plaintext computation");
    }
    
    return decision;
}
