// Peg Engine - Fixed-Point Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>

#include "fixtures.hpp"

using namespace peg;
using namespace peg::test;

TEST_CASE("Wide multiplication", "[fixed_point]") {
    SECTION("Small operands stay in the low limb") {
        U256 p = fp::mul_wide(units(2), units(1));
        REQUIRE(p.hi == 0);
        REQUIRE(p.lo == units(2) * constants::PRECISION);
    }

    SECTION("Full-width product") {
        U256 p = fp::mul_wide(U128_MAX, U128_MAX);
        // (2^128 - 1)^2 = 2^256 - 2^129 + 1
        REQUIRE(p.lo == 1);
        REQUIRE(p.hi == U128_MAX - 1);
    }

    SECTION("Carry into the high limb") {
        U128 two_64 = U128(1) << 64;
        U256 p = fp::mul_wide(two_64, two_64);
        REQUIRE(p.lo == 0);
        REQUIRE(p.hi == 1);
    }
}

TEST_CASE("mul_div", "[fixed_point]") {
    SECTION("Truncates toward zero") {
        REQUIRE(fp::mul_div(10, 1, 3) == 3);
        REQUIRE(fp::mul_div(units(1000), constants::PRECISION, units(1400)) == 714285714285714285ULL);
    }

    SECTION("Intermediate product above 128 bits") {
        U128 big = U128_MAX / 2;
        REQUIRE(fp::mul_div(big, units(3), units(3)) == big);
        REQUIRE(fp::mul_div(U128_MAX, U128_MAX, U128_MAX) == U128_MAX);
    }

    SECTION("Quotient above 128 bits") {
        REQUIRE_THROWS_MATCHES(fp::mul_div(U128_MAX, 2, 1), EngineError,
                               has_code(ErrorCode::ARITHMETIC_OVERFLOW));
        REQUIRE(fp::mul_div_saturating(U128_MAX, 2, 1) == U128_MAX);
    }

    SECTION("Division by zero") {
        REQUIRE_THROWS_MATCHES(fp::mul_div(1, 1, 0), EngineError,
                               has_code(ErrorCode::ARITHMETIC_OVERFLOW));
        REQUIRE(fp::mul_div_saturating(1, 1, 0) == U128_MAX);
    }
}

TEST_CASE("Wide division", "[fixed_point]") {
    // (2^128 + 6) / 3 does not fit in the low limb alone
    U256 num{6, 1};
    auto q = fp::div_wide(num, 3);
    REQUIRE(q.has_value());
    REQUIRE(*q == (U128_MAX / 3) + 2);

    REQUIRE_FALSE(fp::div_wide(U256{0, 5}, 5).has_value());
    REQUIRE_FALSE(fp::div_wide(U256{1, 0}, 0).has_value());
}

TEST_CASE("Checked addition", "[fixed_point]") {
    REQUIRE(fp::checked_add(1, 2) == 3);
    REQUIRE(fp::checked_add(U128_MAX - 1, 1) == U128_MAX);
    REQUIRE_THROWS_MATCHES(fp::checked_add(U128_MAX, 1), EngineError,
                           has_code(ErrorCode::ARITHMETIC_OVERFLOW));
}

TEST_CASE("Decimal strings", "[fixed_point]") {
    SECTION("Formatting") {
        REQUIRE(fp::to_string(0) == "0");
        REQUIRE(fp::to_string(units(1)) == "1000000000000000000");
        REQUIRE(fp::to_string(U128_MAX) == "340282366920938463463374607431768211455");
    }

    SECTION("Parsing") {
        REQUIRE(fp::parse("1000000000000000000") == units(1));
        REQUIRE(fp::parse("340282366920938463463374607431768211455") == U128_MAX);
        REQUIRE_FALSE(fp::parse("340282366920938463463374607431768211456").has_value());
        REQUIRE_FALSE(fp::parse("").has_value());
        REQUIRE_FALSE(fp::parse("12a").has_value());
        REQUIRE_FALSE(fp::parse("-1").has_value());
    }
}
