#include "checked_math.hpp"
#include "errors.hpp"
#include <limits>

namespace {

constexpr int64_t kPow10[] = {
    1LL,
    10LL,
    100LL,
    1000LL,
    10000LL,
    100000LL,
    1000000LL,
    10000000LL,
    100000000LL,
    1000000000LL,
    10000000000LL,
    100000000000LL,
    1000000000000LL,
    10000000000000LL,
    100000000000000LL,
    1000000000000000LL,
    10000000000000000LL,
    100000000000000000LL,
    1000000000000000000LL
};

[[noreturn]] void overflow(const char* op) {
    throw VaultError(ErrorCode::MathOverflow, op);
}

} // namespace

int64_t CheckedMath::add(int64_t a, int64_t b) {
    int64_t out;
    if (__builtin_add_overflow(a, b, &out)) overflow("add");
    return out;
}

int64_t CheckedMath::sub(int64_t a, int64_t b) {
    int64_t out;
    if (__builtin_sub_overflow(a, b, &out)) overflow("sub");
    return out;
}

int64_t CheckedMath::mul(int64_t a, int64_t b) {
    int64_t out;
    if (__builtin_mul_overflow(a, b, &out)) overflow("mul");
    return out;
}

int64_t CheckedMath::div(int64_t a, int64_t b) {
    if (b == 0) overflow("division by zero");
    if (a == std::numeric_limits<int64_t>::min() && b == -1) overflow("div");
    return a / b;
}

uint64_t CheckedMath::add_u64(uint64_t a, uint64_t b) {
    uint64_t out;
    if (__builtin_add_overflow(a, b, &out)) overflow("add_u64");
    return out;
}

uint64_t CheckedMath::sub_u64(uint64_t a, uint64_t b) {
    uint64_t out;
    if (__builtin_sub_overflow(a, b, &out)) overflow("sub_u64");
    return out;
}

uint64_t CheckedMath::mul_u64(uint64_t a, uint64_t b) {
    uint64_t out;
    if (__builtin_mul_overflow(a, b, &out)) overflow("mul_u64");
    return out;
}

uint64_t CheckedMath::div_u64(uint64_t a, uint64_t b) {
    if (b == 0) overflow("division by zero");
    return a / b;
}

int64_t CheckedMath::pow10(uint32_t exp) {
    if (exp >= sizeof(kPow10) / sizeof(kPow10[0])) overflow("pow10");
    return kPow10[exp];
}

int64_t CheckedMath::mul_div(int64_t a, int64_t b, int64_t c) {
    if (c == 0) overflow("division by zero");
    wide_int product = static_cast<wide_int>(a) * static_cast<wide_int>(b);
    return narrow_i64(product / c);
}

uint64_t CheckedMath::mul_div_u64(uint64_t a, uint64_t b, uint64_t c) {
    if (c == 0) overflow("division by zero");
    wide_uint product = static_cast<wide_uint>(a) * static_cast<wide_uint>(b);
    wide_uint quotient = product / c;
    if (quotient > std::numeric_limits<uint64_t>::max()) overflow("mul_div_u64");
    return quotient.convert_to<uint64_t>();
}

int64_t CheckedMath::narrow_i64(wide_int value) {
    if (value > std::numeric_limits<int64_t>::max() ||
        value < std::numeric_limits<int64_t>::min()) {
        overflow("narrow_i64");
    }
    return value.convert_to<int64_t>();
}

uint64_t CheckedMath::narrow_u64(wide_int value) {
    if (value < 0 || value > static_cast<wide_int>(std::numeric_limits<uint64_t>::max())) {
        overflow("narrow_u64");
    }
    return value.convert_to<uint64_t>();
}

int64_t CheckedMath::to_i64(uint64_t value) {
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        overflow("to_i64");
    }
    return static_cast<int64_t>(value);
}

uint64_t CheckedMath::to_u64(int64_t value) {
    if (value < 0) overflow("to_u64");
    return static_cast<uint64_t>(value);
}
