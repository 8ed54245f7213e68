#include <catch2/catch_test_macros.hpp>
#include "../src/issuance.hpp"
#include "../src/valuation.hpp"
#include "test_support.hpp"

TEST_CASE("Share price", "[valuation]") {
    SECTION("Bootstrap price while no shares exist") {
        REQUIRE(Valuator::compute_share_price(0, 0) == kBootstrapSharePrice);
        REQUIRE(Valuator::compute_share_price(5000000000LL, 0) == 1000000);
    }
    
    SECTION("Non-positive TVL with shares outstanding is impaired") {
        REQUIRE(error_of([] { Valuator::compute_share_price(0, 100); }) == ErrorCode::ImpairedVault);
        REQUIRE(error_of([] { Valuator::compute_share_price(-5, 100); }) == ErrorCode::ImpairedVault);
    }
    
    SECTION("First $1000 deposit mints 1e9 shares at $1.00") {
        uint64_t shares = IssuanceCalculator::shares_to_mint(1000000000, kBootstrapSharePrice);
        REQUIRE(shares == 1000000000u);
        REQUIRE(Valuator::compute_share_price(1000000000, shares) == 1000000);
    }
    
    SECTION("Large pools do not overflow") {
        // $1B across 1e18 share units
        REQUIRE(Valuator::compute_share_price(1000000000000000LL, 1000000000000000000ULL) == 1000);
    }
}

TEST_CASE("Vault valuation", "[valuation]") {
    auto composition = tri_asset_vault();
    std::vector<NormalizedPrice> prices = {usd(100000000), usd(50000000000LL), usd(2000000000)};
    auto base = prices[0];
    // 5 SOL, 0.006 BTC, 0.1 ETH
    std::vector<uint64_t> balances = {5000000000ULL, 600000, 10000000};
    
    SECTION("Per-asset values and TVL") {
        auto values = Valuator::asset_values(balances, prices, composition.decimals());
        REQUIRE(values == std::vector<int64_t>{500000000, 300000000, 200000000});
        REQUIRE(Valuator::compute_tvl(balances, prices, composition.decimals()) == 1000000000);
    }
    
    SECTION("Snapshot with shares outstanding") {
        auto snapshot = Valuator::value_vault(composition, balances, prices, base, 1000000000);
        REQUIRE(snapshot.tvl_usd_micro == 1000000000);
        REQUIRE(snapshot.strategy_usd == 0);
        REQUIRE(snapshot.share_price_usd_micro == 1000000);
    }
    
    SECTION("Delegated value is priced in the base currency") {
        StrategyDelegation delegation;
        delegation.strategy_id = "fake-yield";
        delegation.vault_name = composition.name;
        delegation.principal = 2000000000;
        delegation.current_value = 2000000000;
        composition.strategy = delegation;
        
        auto snapshot = Valuator::value_vault(composition, balances, prices, base, 1000000000);
        REQUIRE(snapshot.strategy_usd == 200000000);
        REQUIRE(snapshot.tvl_usd_micro == 1200000000);
        REQUIRE(snapshot.share_price_usd_micro == 1200000);
    }
    
    SECTION("Mismatched inputs are rejected") {
        balances.pop_back();
        REQUIRE(error_of([&] {
            Valuator::value_vault(composition, balances, prices, base, 0);
        }) == ErrorCode::InvalidAssetCount);
    }
}
