#include <catch2/catch_test_macros.hpp>
#include "../src/issuance.hpp"
#include "../src/strategy_ledger.hpp"
#include "test_support.hpp"
#include <memory>

TEST_CASE("Strategy delegation", "[strategy]") {
    auto strategy = std::make_shared<FakeStrategy>();
    StrategyLedger ledger(strategy);
    auto composition = delegated_vault();
    
    SECTION("A ledger needs a strategy") {
        REQUIRE(error_of([] { StrategyLedger empty(nullptr); }) == ErrorCode::StrategyError);
    }
    
    SECTION("Attach binds the delegation to the vault") {
        ledger.attach(composition);
        REQUIRE(composition.strategy.has_value());
        REQUIRE(composition.strategy->strategy_id == "fake-yield");
        REQUIRE(composition.strategy->vault_name == "yield");
        REQUIRE(composition.strategy->principal == 0);
    }
    
    SECTION("Delegating without a delegation fails") {
        REQUIRE(error_of([&] { ledger.delegate(composition, 100); }) == ErrorCode::StrategyError);
    }
    
    SECTION("Delegation records principal and value") {
        ledger.attach(composition);
        ledger.delegate(composition, 2000000000);
        REQUIRE(composition.strategy->principal == 2000000000u);
        REQUIRE(composition.strategy->current_value == 2000000000u);
        REQUIRE(strategy->value == 2000000000u);
    }
    
    SECTION("Zero amounts are rejected") {
        ledger.attach(composition);
        REQUIRE(error_of([&] { ledger.delegate(composition, 0); }) == ErrorCode::InvalidAmount);
    }
    
    SECTION("A failed stake leaves the delegation untouched") {
        ledger.attach(composition);
        ledger.delegate(composition, 1000);
        strategy->fail_stake = true;
        REQUIRE(error_of([&] { ledger.delegate(composition, 500); }) == ErrorCode::StrategyError);
        REQUIRE(composition.strategy->principal == 1000u);
        REQUIRE(composition.strategy->current_value == 1000u);
    }
    
    SECTION("A delegation bound elsewhere is refused") {
        ledger.attach(composition);
        composition.strategy->vault_name = "other";
        REQUIRE(error_of([&] { ledger.delegate(composition, 100); }) == ErrorCode::Unauthorized);
        
        composition.strategy->vault_name = composition.name;
        composition.strategy->strategy_id = "other-yield";
        REQUIRE(error_of([&] { ledger.refresh(composition); }) == ErrorCode::Unauthorized);
        REQUIRE(strategy->stake_calls == 0);
    }
}

TEST_CASE("Strategy unwinding", "[strategy]") {
    auto strategy = std::make_shared<FakeStrategy>();
    StrategyLedger ledger(strategy);
    auto composition = delegated_vault();
    ledger.attach(composition);
    ledger.delegate(composition, 2000000000);
    
    SECTION("Unwinding after a gain reports positive yield") {
        strategy->value = 2200000000;
        auto result = ledger.undelegate(composition, 500000);
        
        REQUIRE(result.requested_amount == 1100000000u);
        REQUIRE(result.received_amount == 1100000000u);
        REQUIRE(result.principal_released == 1000000000u);
        REQUIRE(result.yield_amount == 100000000);
        REQUIRE(composition.strategy->principal == 1000000000u);
        REQUIRE(composition.strategy->current_value == 1100000000u);
    }
    
    SECTION("Unwinding after a loss reports negative yield") {
        strategy->value = 1800000000;
        auto result = ledger.undelegate(composition, 500000);
        REQUIRE(result.received_amount == 900000000u);
        REQUIRE(result.yield_amount == -100000000);
    }
    
    SECTION("Full unwind clears the position") {
        auto result = ledger.undelegate(composition, kFractionScale);
        REQUIRE(result.received_amount == 2000000000u);
        REQUIRE(result.yield_amount == 0);
        REQUIRE(composition.strategy->principal == 0);
        REQUIRE(composition.strategy->current_value == 0);
    }
    
    SECTION("Fraction must be within (0, 100%]") {
        REQUIRE(error_of([&] { ledger.undelegate(composition, 0); }) == ErrorCode::InvalidAmount);
        REQUIRE(error_of([&] { ledger.undelegate(composition, kFractionScale + 1); })
                == ErrorCode::InvalidAmount);
    }
    
    SECTION("A failed unstake leaves the delegation untouched") {
        strategy->fail_unstake = true;
        REQUIRE(error_of([&] { ledger.undelegate(composition, 500000); })
                == ErrorCode::StrategyError);
        REQUIRE(composition.strategy->principal == 2000000000u);
        REQUIRE(composition.strategy->current_value == 2000000000u);
    }
    
    SECTION("Refresh observes the reported value") {
        strategy->value = 2050000000;
        REQUIRE(ledger.refresh(composition) == 2050000000u);
        REQUIRE(composition.strategy->current_value == 2050000000u);
    }
}
