#include "composition.hpp"
#include "errors.hpp"
#include <set>
#include <spdlog/spdlog.h>

void VaultComposition::validate() const {
    if (name.empty() || name.size() > kMaxNameLength) {
        throw VaultError(ErrorCode::InvalidName,
                         "vault name must be 1-" + std::to_string(kMaxNameLength) + " bytes");
    }
    
    if (assets.empty() || assets.size() > kMaxAssets) {
        throw VaultError(ErrorCode::InvalidAssetCount,
                         "asset count must be 1-" + std::to_string(kMaxAssets) +
                         ", got " + std::to_string(assets.size()));
    }
    
    unsigned total_weight = 0;
    size_t delegated = 0;
    std::set<std::string> seen;
    
    for (const auto& asset : assets) {
        if (asset.weight == 0) {
            throw VaultError(ErrorCode::InvalidWeights,
                             "asset " + asset.asset_id + " has zero weight");
        }
        if (!seen.insert(asset.asset_id).second) {
            throw VaultError(ErrorCode::InvalidWeights,
                             "asset " + asset.asset_id + " listed twice");
        }
        if (asset.role == AssetRole::Delegated) {
            delegated++;
        }
        total_weight += asset.weight;
    }
    
    if (total_weight != 100) {
        throw VaultError(ErrorCode::InvalidWeights,
                         "weights sum to " + std::to_string(total_weight) + ", expected 100");
    }
    
    if (delegated > 1) {
        throw VaultError(ErrorCode::InvalidWeights, "at most one delegated asset is allowed");
    }
    
    if (base.decimals > kMaxDecimals) {
        throw VaultError(ErrorCode::InvalidAsset,
                         "base currency has " + std::to_string(base.decimals) + " decimals");
    }
    
    for (const auto& asset : assets) {
        if (asset.decimals > kMaxDecimals) {
            throw VaultError(ErrorCode::InvalidAsset,
                             "asset " + asset.asset_id + " has " +
                             std::to_string(asset.decimals) + " decimals, max " +
                             std::to_string(kMaxDecimals));
        }
        if (asset.role == AssetRole::Standard) {
            continue;
        }
        if (asset.decimals != base.decimals || asset.oracle_feed != base.oracle_feed) {
            spdlog::warn("Asset {} ({}) does not match base currency {}",
                         asset.asset_id, role_string(asset.role), base.symbol);
            throw VaultError(ErrorCode::InvalidAsset,
                             role_string(asset.role) + " asset " + asset.asset_id +
                             " must share the base currency decimals and oracle feed");
        }
    }
}

const AssetAllocation* VaultComposition::find_asset(const std::string& asset_id) const {
    for (const auto& asset : assets) {
        if (asset.asset_id == asset_id) return &asset;
    }
    return nullptr;
}

size_t VaultComposition::index_of(const std::string& asset_id) const {
    for (size_t i = 0; i < assets.size(); i++) {
        if (assets[i].asset_id == asset_id) return i;
    }
    throw VaultError(ErrorCode::AssetNotFound, asset_id);
}

std::optional<size_t> VaultComposition::delegated_index() const {
    for (size_t i = 0; i < assets.size(); i++) {
        if (assets[i].role == AssetRole::Delegated) return i;
    }
    return std::nullopt;
}

std::vector<uint8_t> VaultComposition::weights() const {
    std::vector<uint8_t> out;
    out.reserve(assets.size());
    for (const auto& asset : assets) out.push_back(asset.weight);
    return out;
}

std::vector<uint8_t> VaultComposition::decimals() const {
    std::vector<uint8_t> out;
    out.reserve(assets.size());
    for (const auto& asset : assets) out.push_back(asset.decimals);
    return out;
}

std::string role_string(AssetRole role) {
    switch (role) {
        case AssetRole::Standard: return "standard";
        case AssetRole::Base: return "base";
        case AssetRole::Delegated: return "delegated";
        default: return "unknown";
    }
}

AssetRole parse_role(const std::string& value) {
    if (value == "standard") return AssetRole::Standard;
    if (value == "base") return AssetRole::Base;
    if (value == "delegated") return AssetRole::Delegated;
    spdlog::warn("Unknown asset role '{}'", value);
    throw VaultError(ErrorCode::InvalidWeights, "unknown asset role: " + value);
}

std::string oracle_source_string(OracleSource source) {
    switch (source) {
        case OracleSource::Hermes: return "hermes";
        case OracleSource::Mock: return "mock";
        default: return "unknown";
    }
}

OracleSource parse_oracle_source(const std::string& value) {
    if (value == "hermes") return OracleSource::Hermes;
    if (value == "mock") return OracleSource::Mock;
    throw VaultError(ErrorCode::InvalidPrice, "unknown oracle source: " + value);
}
