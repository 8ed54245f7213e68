#include <catch2/catch_test_macros.hpp>
#include "../src/composition.hpp"
#include "test_support.hpp"

TEST_CASE("Composition validation", "[composition]") {
    auto composition = tri_asset_vault();
    
    SECTION("A well-formed vault passes") {
        REQUIRE_NOTHROW(composition.validate());
        REQUIRE(composition.weights() == std::vector<uint8_t>{50, 30, 20});
        REQUIRE(composition.decimals() == std::vector<uint8_t>{9, 8, 8});
    }
    
    SECTION("Name must be 1 to 32 bytes") {
        composition.name = "";
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidName);
        composition.name = std::string(33, 'v');
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidName);
        composition.name = std::string(32, 'v');
        REQUIRE_NOTHROW(composition.validate());
    }
    
    SECTION("Asset count must be 1 to 10") {
        composition.assets.clear();
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidAssetCount);
        
        for (int i = 0; i < 11; i++) {
            composition.assets.push_back(make_asset("A" + std::to_string(i), 9, 6));
        }
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidAssetCount);
    }
    
    SECTION("Weights must sum to 100") {
        composition.assets[2].weight = 19;
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidWeights);
    }
    
    SECTION("Zero weights are rejected") {
        composition.assets[2].weight = 0;
        composition.assets[1].weight = 50;
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidWeights);
    }
    
    SECTION("Asset ids must be unique") {
        composition.assets[2].asset_id = composition.assets[1].asset_id;
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidWeights);
    }
    
    SECTION("Decimals are capped at 18") {
        composition.assets[1].decimals = 30;
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidAsset);
        composition.assets[1].decimals = 18;
        REQUIRE_NOTHROW(composition.validate());
        
        composition.base.decimals = 19;
        composition.assets[0].decimals = 19;
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidAsset);
    }
    
    SECTION("Base-held assets must match the base currency") {
        // USDC (6 decimals) held as base under a SOL (9 decimals) base currency
        composition.assets[0] = make_asset("USDC", 50, 6, AssetRole::Base);
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidAsset);
        
        composition.assets[0].decimals = 9;
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidAsset);
        
        composition.assets[0].oracle_feed = "SOL";
        REQUIRE_NOTHROW(composition.validate());
        
        composition.assets[0].role = AssetRole::Standard;
        composition.assets[0].decimals = 6;
        composition.assets[0].oracle_feed = "USDC";
        REQUIRE_NOTHROW(composition.validate());
    }
    
    SECTION("Delegated assets must match the base currency") {
        auto delegated = delegated_vault();
        REQUIRE_NOTHROW(delegated.validate());
        delegated.assets[1].oracle_feed = "JSOL";
        REQUIRE(error_of([&] { delegated.validate(); }) == ErrorCode::InvalidAsset);
    }
    
    SECTION("At most one delegated asset") {
        composition.assets[1].role = AssetRole::Delegated;
        composition.assets[2].role = AssetRole::Delegated;
        REQUIRE(error_of([&] { composition.validate(); }) == ErrorCode::InvalidWeights);
    }
}

TEST_CASE("Composition lookups", "[composition]") {
    auto composition = delegated_vault();
    
    SECTION("Assets are found by id") {
        REQUIRE(composition.index_of("BTC-mint") == 2);
        REQUIRE(composition.find_asset("JSOL-mint")->symbol == "JSOL");
        REQUIRE(composition.find_asset("DOGE-mint") == nullptr);
        REQUIRE(error_of([&] { composition.index_of("DOGE-mint"); }) == ErrorCode::AssetNotFound);
    }
    
    SECTION("Delegated asset is resolved by role") {
        REQUIRE(composition.delegated_index() == std::optional<size_t>(1));
        REQUIRE_FALSE(tri_asset_vault().delegated_index().has_value());
    }
    
    SECTION("Role and source names") {
        REQUIRE(parse_role(role_string(AssetRole::Delegated)) == AssetRole::Delegated);
        REQUIRE(parse_oracle_source("mock") == OracleSource::Mock);
        REQUIRE(error_of([] { parse_role("leveraged"); }) == ErrorCode::InvalidWeights);
        REQUIRE(error_of([] { parse_oracle_source("chainlink"); }) == ErrorCode::InvalidPrice);
    }
}
