#ifndef PEG_FIXED_POINT_HPP
#define PEG_FIXED_POINT_HPP

#include <string>
#include <string_view>
#include <optional>

#include "types.hpp"

namespace peg {

// =============================================================================
// 256-bit Intermediate (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;
    U128 hi;

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}
};

// =============================================================================
// Fixed-Point Helpers (all divisions truncate)
// =============================================================================

namespace fp {

U256 mul_wide(U128 a, U128 b);

// floor(num / denom); nullopt when denom is zero or the quotient exceeds 128 bits
std::optional<U128> div_wide(const U256& num, U128 denom);

// floor(a * b / denom) with a 256-bit product; throws ARITHMETIC_OVERFLOW
U128 mul_div(U128 a, U128 b, U128 denom);

// Same as mul_div but clamps to U128_MAX instead of throwing on overflow
U128 mul_div_saturating(U128 a, U128 b, U128 denom);

U128 checked_add(U128 a, U128 b);

// Whole units scaled by 1e18, e.g. from_units(2000) == 2000e18
constexpr U128 from_units(uint64_t whole, U128 scale = constants::PRECISION) {
    return static_cast<U128>(whole) * scale;
}

std::string to_string(U128 v);
std::optional<U128> parse(std::string_view s);

} // namespace fp

} // namespace peg

#endif // PEG_FIXED_POINT_HPP
