#include <catch2/catch_test_macros.hpp>
#include "../src/memory_store.hpp"
#include "../src/mock_oracle.hpp"
#include "../src/price_oracle.hpp"
#include "../src/vault_engine.hpp"
#include "test_support.hpp"
#include <memory>
#include <stdexcept>

namespace {

struct EngineFixture {
    int64_t now = 1000;
    std::shared_ptr<MockPriceOracle> mock = std::make_shared<MockPriceOracle>("authority");
    std::shared_ptr<PriceOracle> oracle = std::make_shared<PriceOracle>();
    std::shared_ptr<InMemoryBalanceStore> store = std::make_shared<InMemoryBalanceStore>();
    std::shared_ptr<FakeStrategy> strategy = std::make_shared<FakeStrategy>();
    std::shared_ptr<SimulatedSwapExecutor> swaps;
    std::unique_ptr<VaultEngine> engine;
    
    EngineFixture() {
        mock->update_prices("authority", {
            {"SOL", 100000000}, {"BTC", 50000000000LL}, {"ETH", 2000000000}
        }, now);
        oracle->register_source(OracleSource::Mock, mock, QuotePolicy{});
        swaps = std::make_shared<SimulatedSwapExecutor>(oracle, [this] { return now; }, store);
        
        EngineCollaborators collab;
        collab.oracle = oracle;
        collab.balances = store;
        collab.swaps = swaps;
        collab.strategy = strategy;
        engine = std::make_unique<VaultEngine>(collab, RebalancePolicy{});
    }
    
    // Moves the deposited funds the way the service does after a deposit
    void settle(const VaultComposition& composition, const DepositReceipt& receipt) {
        for (const auto& slice : receipt.allocation.allocations) {
            if (slice.delegated) continue;
            store->credit(composition.name, composition.assets[slice.asset_index].asset_id,
                          slice.asset_amount);
        }
    }
    
    void settle(const VaultComposition& composition, const WithdrawalReceipt& receipt) {
        for (const auto& release : receipt.quote.releases) {
            store->debit(composition.name, composition.assets[release.asset_index].asset_id,
                         release.amount);
        }
    }
    
    uint64_t balance(const VaultComposition& composition, const std::string& asset_id) {
        return store->get_balance(composition.name, asset_id);
    }
};

} // namespace

TEST_CASE("Vault deposits", "[engine]") {
    EngineFixture f;
    auto composition = tri_asset_vault();
    ShareLedger shares;
    
    SECTION("First deposit mints at $1.00 per share") {
        auto receipt = f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now);
        
        REQUIRE(receipt.before.share_price_usd_micro == kBootstrapSharePrice);
        REQUIRE(receipt.allocation.deposit_usd_micro == 1000000000);
        REQUIRE(receipt.shares_minted == 1000000000u);
        REQUIRE(receipt.tvl_after == 1000000000);
        REQUIRE(receipt.share_price_after == 1000000);
        REQUIRE(shares.balance_of("alice") == 1000000000u);
        
        f.settle(composition, receipt);
        REQUIRE(f.balance(composition, "SOL-mint") == 5000000000ULL);
        REQUIRE(f.balance(composition, "BTC-mint") == 600000u);
        REQUIRE(f.balance(composition, "ETH-mint") == 10000000u);
        
        auto snapshot = f.engine->snapshot(composition, shares, f.now);
        REQUIRE(snapshot.tvl_usd_micro == 1000000000);
        REQUIRE(snapshot.share_price_usd_micro == 1000000);
    }
    
    SECTION("Later deposits mint at the appreciated share price") {
        f.settle(composition, f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now));
        f.mock->update_prices("authority", {{"BTC", 60000000000LL}}, f.now);
        
        auto receipt = f.engine->deposit(composition, shares, "bob", 10000000000ULL, f.now);
        REQUIRE(receipt.before.tvl_usd_micro == 1060000000);
        REQUIRE(receipt.before.share_price_usd_micro == 1060000);
        REQUIRE(receipt.shares_minted == 943396226u);
        REQUIRE(shares.total_supply() == 1943396226u);
    }
    
    SECTION("Dust deposits that mint nothing are rejected") {
        REQUIRE(error_of([&] { f.engine->deposit(composition, shares, "alice", 1, f.now); })
                == ErrorCode::InvalidAmount);
        REQUIRE(error_of([&] { f.engine->deposit(composition, shares, "alice", 0, f.now); })
                == ErrorCode::InvalidAmount);
        REQUIRE(shares.total_supply() == 0);
    }
    
    SECTION("Stale prices abort without side effects") {
        REQUIRE(error_of([&] {
            f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now + 121);
        }) == ErrorCode::StaleQuote);
        REQUIRE(shares.total_supply() == 0);
    }
}

TEST_CASE("Vault withdrawals", "[engine]") {
    EngineFixture f;
    auto composition = tri_asset_vault();
    ShareLedger shares;
    f.settle(composition, f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now));
    
    SECTION("Half the shares release half of every asset") {
        auto receipt = f.engine->withdraw(composition, shares, "alice", 500000000, f.now);
        
        REQUIRE(receipt.tvl_before == 1000000000);
        REQUIRE(receipt.quote.fraction == 500000u);
        REQUIRE(receipt.quote.releases[0].amount == 2500000000ULL);
        REQUIRE(receipt.quote.releases[1].amount == 300000u);
        REQUIRE(receipt.quote.releases[2].amount == 5000000u);
        REQUIRE(receipt.total_settlement == 5000000000ULL);
        REQUIRE_FALSE(receipt.unwind.has_value());
        REQUIRE(shares.balance_of("alice") == 500000000u);
        
        f.settle(composition, receipt);
        REQUIRE(f.engine->snapshot(composition, shares, f.now).share_price_usd_micro == 1000000);
    }
    
    SECTION("Withdrawing more than held fails and burns nothing") {
        REQUIRE(error_of([&] { f.engine->withdraw(composition, shares, "alice", 1000000001, f.now); })
                == ErrorCode::InsufficientShares);
        REQUIRE(error_of([&] { f.engine->withdraw(composition, shares, "bob", 1, f.now); })
                == ErrorCode::InsufficientShares);
        REQUIRE(shares.total_supply() == 1000000000u);
    }
}

TEST_CASE("Vault rebalancing", "[engine]") {
    EngineFixture f;
    auto composition = tri_asset_vault();
    ShareLedger shares;
    f.settle(composition, f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now));
    
    SECTION("A freshly balanced vault needs nothing") {
        auto outcome = f.engine->rebalance(composition, "owner", f.now);
        REQUIRE_FALSE(outcome.report.needs_rebalance);
        REQUIRE(outcome.plan.empty());
        REQUIRE_FALSE(outcome.executed);
    }
    
    SECTION("Only the owner may rebalance") {
        REQUIRE(error_of([&] { f.engine->rebalance(composition, "alice", f.now); })
                == ErrorCode::Unauthorized);
    }
    
    SECTION("Price drift is swapped back to target") {
        f.mock->update_prices("authority", {{"BTC", 100000000000LL}}, f.now);
        
        auto preview = f.engine->rebalance(composition, "owner", f.now, false);
        REQUIRE(preview.report.needs_rebalance);
        REQUIRE(preview.report.total_usd == 1300000000);
        REQUIRE(preview.plan.size() == 2);
        REQUIRE_FALSE(preview.executed);
        REQUIRE(f.balance(composition, "BTC-mint") == 600000u);
        
        auto outcome = f.engine->rebalance(composition, "owner", f.now);
        REQUIRE(outcome.executed);
        REQUIRE(outcome.plan == preview.plan);
        REQUIRE(outcome.plan[0].from_asset == 1);
        REQUIRE(outcome.plan[0].to_asset == 0);
        REQUIRE(outcome.plan[0].amount_in == 150000u);
        REQUIRE(outcome.plan[0].min_amount_out == 1485000000u);
        REQUIRE(outcome.realized_outputs == std::vector<uint64_t>{1500000000, 3000000});
        
        REQUIRE(f.balance(composition, "SOL-mint") == 6500000000ULL);
        REQUIRE(f.balance(composition, "BTC-mint") == 390000u);
        REQUIRE(f.balance(composition, "ETH-mint") == 13000000u);
        REQUIRE_FALSE(f.engine->rebalance(composition, "owner", f.now).report.needs_rebalance);
    }
}

TEST_CASE("Vault strategy delegation", "[engine]") {
    EngineFixture f;
    auto composition = delegated_vault();
    ShareLedger shares;
    
    SECTION("Strategies attach only to vaults with a delegated asset") {
        auto plain = tri_asset_vault();
        REQUIRE(error_of([&] { f.engine->set_strategy(plain, "owner"); }) == ErrorCode::StrategyError);
        REQUIRE(error_of([&] { f.engine->set_strategy(composition, "alice"); })
                == ErrorCode::Unauthorized);
    }
    
    SECTION("Deposits delegate, yield accrues, withdrawals unwind") {
        f.engine->set_strategy(composition, "owner");
        
        auto deposit = f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now);
        REQUIRE(deposit.allocation.delegated_amount == 2000000000ULL);
        REQUIRE(composition.strategy->principal == 2000000000ULL);
        REQUIRE(f.strategy->value == 2000000000ULL);
        f.settle(composition, deposit);
        REQUIRE(f.balance(composition, "JSOL-mint") == 0);
        
        auto snapshot = f.engine->snapshot(composition, shares, f.now);
        REQUIRE(snapshot.strategy_usd == 200000000);
        REQUIRE(snapshot.tvl_usd_micro == 1000000000);
        
        f.strategy->value = 2200000000;
        REQUIRE(f.engine->snapshot(composition, shares, f.now).share_price_usd_micro == 1020000);
        
        REQUIRE(error_of([&] { f.engine->remove_strategy(composition, "owner"); })
                == ErrorCode::StrategyError);
        
        auto withdrawal = f.engine->withdraw(composition, shares, "alice", 1000000000, f.now);
        REQUIRE(withdrawal.quote.settlement_amount == 8000000000ULL);
        REQUIRE(withdrawal.unwind.has_value());
        REQUIRE(withdrawal.unwind->received_amount == 2200000000ULL);
        REQUIRE(withdrawal.unwind->yield_amount == 200000000);
        REQUIRE(withdrawal.total_settlement == 10200000000ULL);
        REQUIRE(composition.strategy->principal == 0);
        REQUIRE(shares.total_supply() == 0);
        
        f.engine->remove_strategy(composition, "owner");
        REQUIRE_FALSE(composition.strategy.has_value());
    }
    
    SECTION("Strategy value counts toward the delegated asset's weight") {
        f.engine->set_strategy(composition, "owner");
        auto deposit = f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now);
        f.settle(composition, deposit);
        REQUIRE(f.balance(composition, "JSOL-mint") == 0);
        
        auto outcome = f.engine->rebalance(composition, "owner", f.now, false);
        REQUIRE_FALSE(outcome.report.needs_rebalance);
        REQUIRE(outcome.plan.empty());
        REQUIRE(outcome.report.total_usd == 1000000000);
        REQUIRE(outcome.report.entries[1].current_usd == 200000000);
        REQUIRE(outcome.report.entries[1].current_weight == 20);
        REQUIRE_FALSE(outcome.report.entries[1].tradable);
        
        // Drift elsewhere is corrected without buying loose delegated tokens
        f.mock->update_prices("authority", {{"BTC", 100000000000LL}}, f.now);
        auto drifted = f.engine->rebalance(composition, "owner", f.now);
        REQUIRE(drifted.executed);
        REQUIRE_FALSE(drifted.plan.empty());
        for (const auto& swap : drifted.plan) {
            REQUIRE(swap.from_asset != 1);
            REQUIRE(swap.to_asset != 1);
        }
        REQUIRE(f.balance(composition, "JSOL-mint") == 0);
        REQUIRE(f.strategy->value == 2000000000ULL);
    }
    
    SECTION("Residual strategy value keeps the delegation attached") {
        f.engine->set_strategy(composition, "owner");
        f.settle(composition, f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now));
        f.settle(composition, f.engine->withdraw(composition, shares, "alice", 1000000000, f.now));
        REQUIRE(composition.strategy->principal == 0);
        
        // Yield reported after the last holder left
        f.strategy->value = 5000;
        f.engine->snapshot(composition, shares, f.now);
        REQUIRE(composition.strategy->current_value == 5000u);
        
        REQUIRE(error_of([&] { f.engine->remove_strategy(composition, "owner"); })
                == ErrorCode::StrategyError);
        REQUIRE(error_of([&] { f.engine->set_strategy(composition, "owner"); })
                == ErrorCode::StrategyError);
        REQUIRE(composition.strategy->current_value == 5000u);
    }
    
    SECTION("A failed stake rolls back the whole deposit") {
        f.engine->set_strategy(composition, "owner");
        f.strategy->fail_stake = true;
        
        REQUIRE(error_of([&] {
            f.engine->deposit(composition, shares, "alice", 10000000000ULL, f.now);
        }) == ErrorCode::StrategyError);
        REQUIRE(shares.total_supply() == 0);
        REQUIRE(composition.strategy->principal == 0);
    }
}

TEST_CASE("Simulated swaps", "[engine]") {
    EngineFixture f;
    auto composition = tri_asset_vault();
    f.store->set_balance(composition.name, "SOL-mint", 1000000000);
    
    SECTION("Fills at oracle prices and moves balances") {
        SwapInstruction swap;
        swap.from_asset = 0;
        swap.to_asset = 2;
        swap.amount_in = 1000000000;    // 1 SOL -> 0.05 ETH
        swap.min_amount_out = 4950000;
        REQUIRE(f.swaps->execute(composition, swap) == 5000000u);
        REQUIRE(f.balance(composition, "SOL-mint") == 0);
        REQUIRE(f.balance(composition, "ETH-mint") == 5000000u);
    }
    
    SECTION("Output below the minimum fails") {
        SwapInstruction swap;
        swap.from_asset = 0;
        swap.to_asset = 2;
        swap.amount_in = 1000000000;
        swap.min_amount_out = 5000001;
        REQUIRE(error_of([&] { f.swaps->execute(composition, swap); }) == ErrorCode::SwapFailed);
        REQUIRE(f.balance(composition, "SOL-mint") == 1000000000u);
    }
    
    SECTION("Unknown assets and short balances fail") {
        SwapInstruction swap;
        swap.from_asset = 7;
        REQUIRE(error_of([&] { f.swaps->execute(composition, swap); }) == ErrorCode::AssetNotFound);
        
        swap.from_asset = 1;
        swap.to_asset = 0;
        swap.amount_in = 100;
        REQUIRE(error_of([&] { f.swaps->execute(composition, swap); })
                == ErrorCode::InsufficientBalance);
    }
}

TEST_CASE("Engine construction", "[engine]") {
    EngineCollaborators collab;
    REQUIRE_THROWS_AS(VaultEngine(collab, RebalancePolicy{}), std::invalid_argument);
}
