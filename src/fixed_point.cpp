// =============================================================================
// fixed_point.cpp - 128-bit amounts with 256-bit intermediate products
// =============================================================================

#include "peg/fixed_point.hpp"
#include <algorithm>

namespace peg {
namespace fp {

U256 mul_wide(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Middle column, at most 3 * (2^64 - 1)
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);
    return result;
}

std::optional<U128> div_wide(const U256& num, U128 denom) {
    if (denom == 0) return std::nullopt;
    if (num.hi == 0) return num.lo / denom;

    // Quotient has more than 128 bits
    if (num.hi >= denom) return std::nullopt;

    // Restoring division over the low limb. rem < denom holds before every step;
    // the shifted remainder may need 129 bits, carried in `top`.
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool top = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (top || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    return quot;
}

U128 mul_div(U128 a, U128 b, U128 denom) {
    if (denom == 0) {
        throw EngineError(ErrorCode::ARITHMETIC_OVERFLOW, "mul_div: division by zero");
    }
    auto q = div_wide(mul_wide(a, b), denom);
    if (!q) {
        throw EngineError(ErrorCode::ARITHMETIC_OVERFLOW, "mul_div: result exceeds 128 bits");
    }
    return *q;
}

U128 mul_div_saturating(U128 a, U128 b, U128 denom) {
    if (denom == 0) return U128_MAX;
    auto q = div_wide(mul_wide(a, b), denom);
    return q ? *q : U128_MAX;
}

U128 checked_add(U128 a, U128 b) {
    if (a > U128_MAX - b) {
        throw EngineError(ErrorCode::ARITHMETIC_OVERFLOW, "addition overflows 128 bits");
    }
    return a + b;
}

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<U128> parse(std::string_view s) {
    if (s.empty()) return std::nullopt;
    U128 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (v > (U128_MAX - digit) / 10) return std::nullopt;
        v = v * 10 + digit;
    }
    return v;
}

} // namespace fp
} // namespace peg
