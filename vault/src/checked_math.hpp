#pragma once

#include <cstdint>
#include <boost/multiprecision/cpp_int.hpp>

// 128-bit intermediates for a * b / c style products. The checked backends
// throw std::overflow_error rather than wrap.
using wide_int = boost::multiprecision::checked_int128_t;
using wide_uint = boost::multiprecision::checked_uint128_t;

// Checked integer arithmetic. Every overflow, division by zero or lossy
// narrowing throws VaultError(MathOverflow).
class CheckedMath {
public:
    static int64_t add(int64_t a, int64_t b);
    static int64_t sub(int64_t a, int64_t b);
    static int64_t mul(int64_t a, int64_t b);
    static int64_t div(int64_t a, int64_t b);
    
    static uint64_t add_u64(uint64_t a, uint64_t b);
    static uint64_t sub_u64(uint64_t a, uint64_t b);
    static uint64_t mul_u64(uint64_t a, uint64_t b);
    static uint64_t div_u64(uint64_t a, uint64_t b);
    
    // 10^exp, exp in [0, 18]
    static int64_t pow10(uint32_t exp);
    
    // a * b / c, truncating toward zero
    static int64_t mul_div(int64_t a, int64_t b, int64_t c);
    static uint64_t mul_div_u64(uint64_t a, uint64_t b, uint64_t c);
    
    static int64_t narrow_i64(wide_int value);
    static uint64_t narrow_u64(wide_int value);
    static int64_t to_i64(uint64_t value);
    static uint64_t to_u64(int64_t value);
};
