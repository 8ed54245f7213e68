#include "price_normalizer.hpp"
#include "checked_math.hpp"
#include "errors.hpp"
#include <limits>
#include <spdlog/spdlog.h>

NormalizedPrice PriceNormalizer::normalize(int64_t raw_price, int32_t raw_exponent) {
    if (raw_price <= 0) {
        throw VaultError(ErrorCode::InvalidPrice,
                         "raw price must be positive, got " + std::to_string(raw_price));
    }
    
    NormalizedPrice price;
    price.raw_price = raw_price;
    price.raw_exponent = raw_exponent;
    
    int64_t shift = static_cast<int64_t>(raw_exponent) + kUsdDecimals;
    
    if (shift < 0) {
        // More precision than we keep, divide down
        if (-shift > 18) {
            // Any int64 mantissa divides down to zero
            throw VaultError(ErrorCode::InvalidPrice,
                             "exponent " + std::to_string(raw_exponent) +
                             " leaves no whole micro-dollar");
        }
        price.usd_micro = CheckedMath::div(raw_price,
                                           CheckedMath::pow10(static_cast<uint32_t>(-shift)));
    } else if (shift > 0) {
        if (shift > 18) {
            throw VaultError(ErrorCode::MathOverflow,
                             "exponent " + std::to_string(raw_exponent) + " out of range");
        }
        price.usd_micro = CheckedMath::mul(raw_price,
                                           CheckedMath::pow10(static_cast<uint32_t>(shift)));
    } else {
        price.usd_micro = raw_price;
    }
    
    if (price.usd_micro <= 0) {
        throw VaultError(ErrorCode::InvalidPrice,
                         "price " + std::to_string(raw_price) + "e" +
                         std::to_string(raw_exponent) + " is below one micro-dollar");
    }
    
    spdlog::debug("Normalized price {}e{} -> {} usd_micro",
                  raw_price, raw_exponent, price.usd_micro);
    return price;
}

uint64_t PriceNormalizer::usd_to_tokens(const NormalizedPrice& price, int64_t usd_micro,
                                        uint8_t token_decimals) {
    if (usd_micro < 0) {
        throw VaultError(ErrorCode::InvalidAmount, "negative USD amount");
    }
    if (price.usd_micro <= 0) {
        throw VaultError(ErrorCode::InvalidPrice, "non-positive price");
    }
    
    wide_int scaled = static_cast<wide_int>(usd_micro) * CheckedMath::pow10(token_decimals);
    return CheckedMath::narrow_u64(scaled / price.usd_micro);
}

int64_t PriceNormalizer::tokens_to_usd(const NormalizedPrice& price, uint64_t amount,
                                       uint8_t token_decimals) {
    if (price.usd_micro <= 0) {
        throw VaultError(ErrorCode::InvalidPrice, "non-positive price");
    }
    
    wide_int value = static_cast<wide_int>(amount) * price.usd_micro;
    return CheckedMath::narrow_i64(value / CheckedMath::pow10(token_decimals));
}

uint64_t PriceNormalizer::convert_amount(uint64_t amount_in,
                                         const NormalizedPrice& from, uint8_t from_decimals,
                                         const NormalizedPrice& to, uint8_t to_decimals) {
    if (from.usd_micro <= 0 || to.usd_micro <= 0) {
        throw VaultError(ErrorCode::InvalidPrice, "non-positive price");
    }
    
    wide_uint numerator = static_cast<wide_uint>(amount_in) *
                          static_cast<wide_uint>(from.usd_micro);
    wide_uint denominator = static_cast<wide_uint>(to.usd_micro);
    
    if (to_decimals >= from_decimals) {
        wide_uint factor = static_cast<wide_uint>(
            CheckedMath::pow10(static_cast<uint32_t>(to_decimals - from_decimals)));
        if (numerator > std::numeric_limits<wide_uint>::max() / factor) {
            throw VaultError(ErrorCode::MathOverflow, "convert_amount");
        }
        numerator *= factor;
    } else {
        denominator *= static_cast<wide_uint>(
            CheckedMath::pow10(static_cast<uint32_t>(from_decimals - to_decimals)));
    }
    
    wide_uint amount_out = numerator / denominator;
    if (amount_out > std::numeric_limits<uint64_t>::max()) {
        throw VaultError(ErrorCode::MathOverflow, "convert_amount");
    }
    return amount_out.convert_to<uint64_t>();
}
