#include <catch2/catch_test_macros.hpp>
#include "../src/checked_math.hpp"
#include "../src/price_normalizer.hpp"
#include "test_support.hpp"
#include <limits>

TEST_CASE("Price normalization", "[price]") {
    SECTION("Finer exponents are divided down") {
        auto price = PriceNormalizer::normalize(14231343, -8);
        REQUIRE(price.usd_micro == 142313);
        REQUIRE(price.raw_price == 14231343);
        REQUIRE(price.raw_exponent == -8);
    }
    
    SECTION("Coarser exponents are scaled up") {
        REQUIRE(PriceNormalizer::normalize(5, 0).usd_micro == 5000000);
        REQUIRE(PriceNormalizer::normalize(3, 2).usd_micro == 300000000);
    }
    
    SECTION("Exponent -6 is taken as is") {
        REQUIRE(PriceNormalizer::normalize(123, -6).usd_micro == 123);
    }
    
    SECTION("Non-positive prices are rejected") {
        REQUIRE(error_of([] { PriceNormalizer::normalize(0, -6); }) == ErrorCode::InvalidPrice);
        REQUIRE(error_of([] { PriceNormalizer::normalize(-5, -6); }) == ErrorCode::InvalidPrice);
    }
    
    SECTION("Prices below one micro-dollar are rejected") {
        REQUIRE(error_of([] { PriceNormalizer::normalize(1, -7); }) == ErrorCode::InvalidPrice);
    }
    
    SECTION("Exponents too fine for any mantissa are invalid prices") {
        REQUIRE(error_of([] { PriceNormalizer::normalize(1, -25); }) == ErrorCode::InvalidPrice);
        REQUIRE(error_of([] {
            PriceNormalizer::normalize(std::numeric_limits<int64_t>::max(), -25);
        }) == ErrorCode::InvalidPrice);
    }
    
    SECTION("Coarse exponents outside the scaling table overflow") {
        REQUIRE(error_of([] { PriceNormalizer::normalize(1, 13); }) == ErrorCode::MathOverflow);
        REQUIRE(error_of([] {
            PriceNormalizer::normalize(std::numeric_limits<int64_t>::max(), 0);
        }) == ErrorCode::MathOverflow);
    }
}

TEST_CASE("Token and USD conversion", "[price]") {
    auto sol = usd(100000000);          // $100
    auto btc = usd(50000000000LL);      // $50,000
    auto usdc = usd(1000000);           // $1
    
    SECTION("USD to tokens") {
        REQUIRE(PriceNormalizer::usd_to_tokens(sol, 1000000000, 9) == 10000000000ULL);
        REQUIRE(PriceNormalizer::usd_to_tokens(btc, 300000000, 8) == 600000u);
    }
    
    SECTION("Tokens to USD") {
        REQUIRE(PriceNormalizer::tokens_to_usd(sol, 10000000000ULL, 9) == 1000000000);
        REQUIRE(PriceNormalizer::tokens_to_usd(btc, 600000, 8) == 300000000);
    }
    
    SECTION("Negative USD is rejected") {
        REQUIRE(error_of([&] { PriceNormalizer::usd_to_tokens(sol, -1, 9); })
                == ErrorCode::InvalidAmount);
    }
    
    SECTION("Round trips lose at most one token unit of value") {
        const int64_t value = 123456789;
        // Loss is bounded by the USD value of one base unit, rounded up
        auto check = [&](const NormalizedPrice& price, uint8_t max_decimals) {
            for (uint8_t d = 0; d <= max_decimals; d++) {
                int64_t unit = CheckedMath::pow10(d);
                uint64_t tokens = PriceNormalizer::usd_to_tokens(price, value, d);
                int64_t back = PriceNormalizer::tokens_to_usd(price, tokens, d);
                REQUIRE(back <= value);
                REQUIRE(value - back <= (price.usd_micro + unit - 1) / unit);
            }
        };
        
        auto eth = usd(3000000000LL);
        check(eth, 18);
        check(usd(7), 11);
        
        // At a price divisible by 10^d the bound is the exact unit value
        uint64_t tokens = PriceNormalizer::usd_to_tokens(eth, value, 6);
        REQUIRE(value - PriceNormalizer::tokens_to_usd(eth, tokens, 6) < eth.usd_micro / 1000000 + 1);
    }
    
    SECTION("convert_amount across decimals") {
        // 10 SOL -> 0.02 BTC
        REQUIRE(PriceNormalizer::convert_amount(10000000000ULL, sol, 9, btc, 8) == 2000000u);
        // 1 USDC -> 0.01 SOL
        REQUIRE(PriceNormalizer::convert_amount(1000000, usdc, 6, sol, 9) == 10000000u);
    }
    
    SECTION("convert_amount truncates to zero without throwing") {
        REQUIRE(PriceNormalizer::convert_amount(1, usdc, 6, btc, 8) == 0u);
    }
}
