#pragma once

#include <cstdint>

// Canonical price unit: USD with 6 decimals ("micro-dollars")
constexpr int32_t kUsdDecimals = 6;
constexpr int64_t kUsdMicro = 1000000;

struct NormalizedPrice {
    int64_t usd_micro = 0;
    int64_t raw_price = 0;
    int32_t raw_exponent = 0;
};

class PriceNormalizer {
public:
    // raw_price * 10^raw_exponent -> USD micro. Throws InvalidPrice for a
    // non-positive result and MathOverflow when scaling does not fit 64 bits.
    static NormalizedPrice normalize(int64_t raw_price, int32_t raw_exponent);
    
    // Amount in the asset's minor units for a USD-micro value (truncating)
    static uint64_t usd_to_tokens(const NormalizedPrice& price, int64_t usd_micro,
                                  uint8_t token_decimals);
    
    // USD-micro value of an amount in the asset's minor units (truncating)
    static int64_t tokens_to_usd(const NormalizedPrice& price, uint64_t amount,
                                 uint8_t token_decimals);
    
    // Expected output of swapping amount_in of one asset into another at
    // the given prices. No fees or slippage.
    static uint64_t convert_amount(uint64_t amount_in,
                                   const NormalizedPrice& from, uint8_t from_decimals,
                                   const NormalizedPrice& to, uint8_t to_decimals);
};
