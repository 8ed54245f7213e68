#pragma once

#include "composition.hpp"
#include "confidential.hpp"
#include "rebalancer.hpp"
#include "valuation.hpp"
#include "vault_engine.hpp"
#include <nlohmann/json.hpp>

// nlohmann/json conversions for the wire and audit payloads

void to_json(nlohmann::json& j, const AssetAllocation& asset);
void from_json(const nlohmann::json& j, AssetAllocation& asset);

void to_json(nlohmann::json& j, const BaseCurrency& base);
void from_json(const nlohmann::json& j, BaseCurrency& base);

void to_json(nlohmann::json& j, const StrategyDelegation& delegation);
void from_json(const nlohmann::json& j, StrategyDelegation& delegation);

void to_json(nlohmann::json& j, const VaultComposition& composition);
void from_json(const nlohmann::json& j, VaultComposition& composition);

void to_json(nlohmann::json& j, const ValuationSnapshot& snapshot);
void to_json(nlohmann::json& j, const DriftReport& report);

void to_json(nlohmann::json& j, const SwapInstruction& swap);
void from_json(const nlohmann::json& j, SwapInstruction& swap);

void to_json(nlohmann::json& j, const RebalancingInput& input);
void from_json(const nlohmann::json& j, RebalancingInput& input);
void to_json(nlohmann::json& j, const RebalancingResult& result);
void from_json(const nlohmann::json& j, RebalancingResult& result);

void to_json(nlohmann::json& j, const DepositReceipt& receipt);
void to_json(nlohmann::json& j, const WithdrawalReceipt& receipt);
void to_json(nlohmann::json& j, const RebalanceOutcome& outcome);
