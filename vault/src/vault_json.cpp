#include "vault_json.hpp"
#include "errors.hpp"

namespace {

uint8_t small_uint(const nlohmann::json& j, const char* key, ErrorCode code) {
    int value = j.at(key).get<int>();
    if (value < 0 || value > 255) {
        throw VaultError(code, std::string(key) + " out of range: " + std::to_string(value));
    }
    return static_cast<uint8_t>(value);
}

std::vector<int> widen(const std::vector<uint8_t>& values) {
    return std::vector<int>(values.begin(), values.end());
}

std::vector<uint8_t> narrow(const nlohmann::json& j, const char* key) {
    std::vector<uint8_t> out;
    for (const auto& item : j.at(key)) {
        int value = item.get<int>();
        if (value < 0 || value > 255) {
            throw VaultError(ErrorCode::InvalidWeights,
                             std::string(key) + " entry out of range: " + std::to_string(value));
        }
        out.push_back(static_cast<uint8_t>(value));
    }
    return out;
}

} // namespace

void to_json(nlohmann::json& j, const AssetAllocation& asset) {
    j = {
        {"asset_id", asset.asset_id},
        {"symbol", asset.symbol},
        {"weight", static_cast<int>(asset.weight)},
        {"decimals", static_cast<int>(asset.decimals)},
        {"balance_handle", asset.balance_handle},
        {"oracle_feed", asset.oracle_feed},
        {"role", role_string(asset.role)}
    };
}

void from_json(const nlohmann::json& j, AssetAllocation& asset) {
    asset.asset_id = j.at("asset_id").get<std::string>();
    asset.symbol = j.value("symbol", "");
    asset.weight = small_uint(j, "weight", ErrorCode::InvalidWeights);
    asset.decimals = small_uint(j, "decimals", ErrorCode::InvalidAmount);
    asset.balance_handle = j.value("balance_handle", "");
    asset.oracle_feed = j.at("oracle_feed").get<std::string>();
    asset.role = parse_role(j.value("role", "standard"));
}

void to_json(nlohmann::json& j, const BaseCurrency& base) {
    j = {
        {"asset_id", base.asset_id},
        {"symbol", base.symbol},
        {"decimals", static_cast<int>(base.decimals)},
        {"oracle_feed", base.oracle_feed}
    };
}

void from_json(const nlohmann::json& j, BaseCurrency& base) {
    base.asset_id = j.at("asset_id").get<std::string>();
    base.symbol = j.value("symbol", "");
    base.decimals = j.contains("decimals") ? small_uint(j, "decimals", ErrorCode::InvalidAmount) : 9;
    base.oracle_feed = j.at("oracle_feed").get<std::string>();
}

void to_json(nlohmann::json& j, const StrategyDelegation& delegation) {
    j = {
        {"strategy_id", delegation.strategy_id},
        {"vault_name", delegation.vault_name},
        {"principal", delegation.principal},
        {"current_value", delegation.current_value}
    };
}

void from_json(const nlohmann::json& j, StrategyDelegation& delegation) {
    delegation.strategy_id = j.at("strategy_id").get<std::string>();
    delegation.vault_name = j.at("vault_name").get<std::string>();
    delegation.principal = j.value("principal", uint64_t{0});
    delegation.current_value = j.value("current_value", uint64_t{0});
}

void to_json(nlohmann::json& j, const VaultComposition& composition) {
    j = {
        {"owner", composition.owner},
        {"name", composition.name},
        {"share_unit", composition.share_unit},
        {"oracle_source", oracle_source_string(composition.oracle_source)},
        {"base", composition.base},
        {"assets", composition.assets}
    };
    if (composition.strategy.has_value()) {
        j["strategy"] = *composition.strategy;
    } else {
        j["strategy"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, VaultComposition& composition) {
    composition.owner = j.at("owner").get<std::string>();
    composition.name = j.at("name").get<std::string>();
    composition.share_unit = j.value("share_unit", "");
    composition.oracle_source = parse_oracle_source(j.value("oracle_source", "hermes"));
    composition.base = j.at("base").get<BaseCurrency>();
    composition.assets = j.at("assets").get<std::vector<AssetAllocation>>();
    if (j.contains("strategy") && !j.at("strategy").is_null()) {
        composition.strategy = j.at("strategy").get<StrategyDelegation>();
    } else {
        composition.strategy.reset();
    }
}

void to_json(nlohmann::json& j, const ValuationSnapshot& snapshot) {
    j = {
        {"asset_usd", snapshot.asset_usd},
        {"strategy_usd", snapshot.strategy_usd},
        {"tvl_usd_micro", snapshot.tvl_usd_micro},
        {"total_shares", snapshot.total_shares},
        {"share_price_usd_micro", snapshot.share_price_usd_micro}
    };
}

void to_json(nlohmann::json& j, const DriftReport& report) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : report.entries) {
        entries.push_back({
            {"asset_index", entry.asset_index},
            {"current_usd", entry.current_usd},
            {"target_usd", entry.target_usd},
            {"current_weight", entry.current_weight},
            {"target_weight", entry.target_weight},
            {"drift", entry.drift},
            {"exceeds_threshold", entry.exceeds_threshold},
            {"tradable", entry.tradable}
        });
    }
    j = {
        {"entries", entries},
        {"total_usd", report.total_usd},
        {"threshold_percent", report.threshold_percent},
        {"needs_rebalance", report.needs_rebalance}
    };
}

void to_json(nlohmann::json& j, const SwapInstruction& swap) {
    j = {
        {"from_asset", swap.from_asset},
        {"to_asset", swap.to_asset},
        {"amount_in", swap.amount_in},
        {"min_amount_out", swap.min_amount_out},
        {"usd_value", swap.usd_value}
    };
}

void from_json(const nlohmann::json& j, SwapInstruction& swap) {
    swap.from_asset = j.at("from_asset").get<size_t>();
    swap.to_asset = j.at("to_asset").get<size_t>();
    swap.amount_in = j.at("amount_in").get<uint64_t>();
    swap.min_amount_out = j.at("min_amount_out").get<uint64_t>();
    swap.usd_value = j.value("usd_value", int64_t{0});
}

void to_json(nlohmann::json& j, const RebalancingInput& input) {
    j = {
        {"balances", input.balances},
        {"prices_usd_micro", input.prices_usd_micro},
        {"weights", widen(input.weights)},
        {"decimals", widen(input.decimals)},
        {"threshold_percent", input.threshold_percent},
        {"strategy_holding", nullptr}
    };
    if (input.strategy_holding.has_value()) {
        j["strategy_holding"] = {
            {"asset_index", input.strategy_holding->asset_index},
            {"usd_micro", input.strategy_holding->usd_micro}
        };
    }
}

void from_json(const nlohmann::json& j, RebalancingInput& input) {
    input.balances = j.at("balances").get<std::vector<uint64_t>>();
    input.prices_usd_micro = j.at("prices_usd_micro").get<std::vector<int64_t>>();
    input.weights = narrow(j, "weights");
    input.decimals = narrow(j, "decimals");
    input.threshold_percent = j.value("threshold_percent", 5);
    
    input.strategy_holding.reset();
    if (j.contains("strategy_holding") && !j["strategy_holding"].is_null()) {
        const auto& holding = j["strategy_holding"];
        ExternalHolding external;
        external.asset_index = holding.at("asset_index").get<size_t>();
        external.usd_micro = holding.at("usd_micro").get<int64_t>();
        input.strategy_holding = external;
    }
}

void to_json(nlohmann::json& j, const RebalancingResult& result) {
    j = {
        {"needs_rebalance", result.needs_rebalance},
        {"drifts", result.drifts},
        {"total_tvl", result.total_tvl},
        {"swaps", result.swaps}
    };
}

void from_json(const nlohmann::json& j, RebalancingResult& result) {
    result.needs_rebalance = j.at("needs_rebalance").get<bool>();
    result.drifts = j.at("drifts").get<std::vector<int32_t>>();
    result.total_tvl = j.at("total_tvl").get<int64_t>();
    result.swaps = j.at("swaps").get<SwapPlan>();
}

void to_json(nlohmann::json& j, const DepositReceipt& receipt) {
    nlohmann::json allocations = nlohmann::json::array();
    for (const auto& alloc : receipt.allocation.allocations) {
        allocations.push_back({
            {"asset_index", alloc.asset_index},
            {"base_amount", alloc.base_amount},
            {"usd_micro", alloc.usd_micro},
            {"asset_amount", alloc.asset_amount},
            {"delegated", alloc.delegated}
        });
    }
    j = {
        {"holder", receipt.holder},
        {"amount", receipt.amount},
        {"base_price_usd_micro", receipt.base_price.usd_micro},
        {"deposit_usd_micro", receipt.allocation.deposit_usd_micro},
        {"allocations", allocations},
        {"delegated_amount", receipt.allocation.delegated_amount},
        {"shares_minted", receipt.shares_minted},
        {"share_price_before", receipt.before.share_price_usd_micro},
        {"tvl_before", receipt.before.tvl_usd_micro},
        {"tvl_after", receipt.tvl_after},
        {"share_price_after", receipt.share_price_after}
    };
}

void to_json(nlohmann::json& j, const WithdrawalReceipt& receipt) {
    nlohmann::json releases = nlohmann::json::array();
    for (const auto& release : receipt.quote.releases) {
        releases.push_back({
            {"asset_index", release.asset_index},
            {"amount", release.amount},
            {"usd_micro", release.usd_micro}
        });
    }
    j = {
        {"holder", receipt.holder},
        {"tvl_before", receipt.tvl_before},
        {"shares_burned", receipt.quote.shares_to_burn},
        {"fraction", receipt.quote.fraction},
        {"releases", releases},
        {"release_usd_micro", receipt.quote.release_usd_micro},
        {"settlement_amount", receipt.quote.settlement_amount},
        {"total_settlement", receipt.total_settlement}
    };
    if (receipt.unwind.has_value()) {
        j["unwind"] = {
            {"requested_amount", receipt.unwind->requested_amount},
            {"received_amount", receipt.unwind->received_amount},
            {"principal_released", receipt.unwind->principal_released},
            {"yield_amount", receipt.unwind->yield_amount}
        };
    } else {
        j["unwind"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const RebalanceOutcome& outcome) {
    j = {
        {"report", outcome.report},
        {"plan", outcome.plan},
        {"realized_outputs", outcome.realized_outputs},
        {"executed", outcome.executed}
    };
}
