#include <catch2/catch_test_macros.hpp>
#include "../src/mock_oracle.hpp"
#include "../src/price_oracle.hpp"
#include "test_support.hpp"
#include <memory>

TEST_CASE("Mock oracle", "[oracle]") {
    MockPriceOracle mock("authority");
    
    SECTION("Only the authority can update") {
        REQUIRE(error_of([&] { mock.update_prices("intruder", {{"SOL", 100000000}}, 10); })
                == ErrorCode::Unauthorized);
    }
    
    SECTION("Quotes carry micro-dollar exponent and update time") {
        mock.update_prices("authority", {{"SOL", 100000000}}, 10);
        auto quote = mock.get_quote("SOL");
        REQUIRE(quote.raw_price == 100000000);
        REQUIRE(quote.raw_exponent == -6);
        REQUIRE(quote.observed_at == 10);
        REQUIRE(mock.last_update() == 10);
    }
    
    SECTION("Out-of-range prices reject the whole update") {
        mock.update_prices("authority", {{"SOL", 100000000}}, 10);
        REQUIRE(error_of([&] {
            mock.update_prices("authority", {{"SOL", 1}, {"BTC", 0}}, 20);
        }) == ErrorCode::InvalidPrice);
        REQUIRE(error_of([&] {
            mock.update_prices("authority", {{"BTC", MockPriceOracle::kMaxPriceUsdMicro}}, 20);
        }) == ErrorCode::InvalidPrice);
        REQUIRE(mock.get_quote("SOL").raw_price == 100000000);
        REQUIRE(mock.last_update() == 10);
    }
    
    SECTION("Unknown feeds have no price") {
        REQUIRE(error_of([&] { mock.get_quote("DOGE"); }) == ErrorCode::InvalidPrice);
    }
}

TEST_CASE("Quote acceptance", "[oracle]") {
    QuotePolicy policy;
    OracleQuote quote;
    quote.raw_price = 14231343;
    quote.raw_exponent = -8;
    quote.observed_at = 1000;
    
    SECTION("Fresh quotes are normalized") {
        REQUIRE(PriceOracle::accept_quote(quote, policy, 1120).usd_micro == 142313);
    }
    
    SECTION("Quotes older than the maximum age are stale") {
        REQUIRE(error_of([&] { PriceOracle::accept_quote(quote, policy, 1121); })
                == ErrorCode::StaleQuote);
    }
    
    SECTION("Quotes from the future are accepted") {
        REQUIRE_NOTHROW(PriceOracle::accept_quote(quote, policy, 900));
    }
    
    SECTION("Non-positive quotes are invalid") {
        quote.raw_price = 0;
        REQUIRE(error_of([&] { PriceOracle::accept_quote(quote, policy, 1000); })
                == ErrorCode::InvalidPrice);
    }
    
    SECTION("Prices at the sanity ceiling are invalid") {
        quote.raw_price = 10000000;
        quote.raw_exponent = 0;     // $10M == 1e13 usd_micro
        REQUIRE(error_of([&] { PriceOracle::accept_quote(quote, policy, 1000); })
                == ErrorCode::InvalidPrice);
    }
}

TEST_CASE("Vault pricing", "[oracle]") {
    auto mock = std::make_shared<MockPriceOracle>("authority");
    mock->update_prices("authority", {
        {"SOL", 100000000}, {"BTC", 50000000000LL}, {"ETH", 2000000000}
    }, 1000);
    
    PriceOracle oracle;
    auto composition = tri_asset_vault();
    
    SECTION("Missing source is reported") {
        REQUIRE(error_of([&] { oracle.price_vault(composition, 1000); }) == ErrorCode::InvalidPrice);
        REQUIRE_FALSE(oracle.is_healthy());
    }
    
    SECTION("Base and every asset are priced from the vault's source") {
        oracle.register_source(OracleSource::Mock, mock, QuotePolicy{});
        REQUIRE(oracle.has_source(OracleSource::Mock));
        REQUIRE(oracle.is_healthy());
        
        auto prices = oracle.price_vault(composition, 1010);
        REQUIRE(prices.base.usd_micro == 100000000);
        REQUIRE(prices.assets.size() == 3);
        REQUIRE(prices.assets[0].usd_micro == 100000000);
        REQUIRE(prices.assets[1].usd_micro == 50000000000LL);
        REQUIRE(prices.assets[2].usd_micro == 2000000000);
    }
    
    SECTION("A stale source fails the whole vault") {
        QuotePolicy tight;
        tight.max_age_secs = 5;
        oracle.register_source(OracleSource::Mock, mock, tight);
        REQUIRE(error_of([&] { oracle.price_vault(composition, 1006); }) == ErrorCode::StaleQuote);
    }
}
