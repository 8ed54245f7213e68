#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Explicit per-asset treatment, resolved by identity rather than by weight
enum class AssetRole {
    Standard,   // converted from the base currency on deposit
    Base,       // held in the base currency, no conversion
    Delegated   // base currency routed to the yield strategy
};

enum class OracleSource {
    Hermes,     // Pyth Hermes price gateway
    Mock        // authority-updated in-process oracle
};

struct AssetAllocation {
    std::string asset_id;
    std::string symbol;
    uint8_t weight = 0;
    uint8_t decimals = 0;
    std::string balance_handle;
    std::string oracle_feed;
    AssetRole role = AssetRole::Standard;
};

// Deposit and settlement currency of a vault
struct BaseCurrency {
    std::string asset_id;
    std::string symbol;
    uint8_t decimals = 9;
    std::string oracle_feed;
};

struct StrategyDelegation {
    std::string strategy_id;
    std::string vault_name;     // the one vault this delegation is bound to
    uint64_t principal = 0;     // base currency minor units
    uint64_t current_value = 0; // as last observed
};

struct VaultComposition {
    static constexpr size_t kMaxAssets = 10;
    static constexpr size_t kMaxNameLength = 32;
    static constexpr uint8_t kShareDecimals = 9;
    static constexpr uint8_t kMaxDecimals = 18;
    
    std::string owner;
    std::string name;
    std::vector<AssetAllocation> assets;
    std::string share_unit;
    BaseCurrency base;
    std::optional<StrategyDelegation> strategy;
    OracleSource oracle_source = OracleSource::Hermes;
    
    // Throws InvalidName, InvalidAssetCount, InvalidWeights or InvalidAsset.
    // Base and Delegated assets hold base currency units, so they must share
    // the base currency's decimals and oracle feed.
    void validate() const;
    
    const AssetAllocation* find_asset(const std::string& asset_id) const;
    size_t index_of(const std::string& asset_id) const;
    std::optional<size_t> delegated_index() const;
    
    std::vector<uint8_t> weights() const;
    std::vector<uint8_t> decimals() const;
};

std::string role_string(AssetRole role);
AssetRole parse_role(const std::string& value);
std::string oracle_source_string(OracleSource source);
OracleSource parse_oracle_source(const std::string& value);
