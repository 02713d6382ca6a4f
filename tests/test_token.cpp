// Peg Engine - Token Ledger Tests

#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace peg;
using namespace peg::test;

TEST_CASE("Collateral token transfers", "[token]") {
    CollateralToken token(WETH, "WETH");
    token.mint(ALICE, units(10));

    SECTION("Transfer moves balance") {
        REQUIRE(token.transfer(ALICE, BOB, units(4)));
        REQUIRE(token.balance_of(ALICE) == units(6));
        REQUIRE(token.balance_of(BOB) == units(4));
        REQUIRE(token.total_supply() == units(10));
    }

    SECTION("Insufficient balance fails without effect") {
        REQUIRE_FALSE(token.transfer(ALICE, BOB, units(11)));
        REQUIRE(token.balance_of(ALICE) == units(10));
        REQUIRE(token.balance_of(BOB) == 0);
    }

    SECTION("Zero address recipient is refused") {
        REQUIRE_FALSE(token.transfer(ALICE, ZERO_ADDRESS, units(1)));
    }

    SECTION("Minting to the zero address throws") {
        REQUIRE_THROWS_AS(token.mint(ZERO_ADDRESS, units(1)), TokenError);
    }
}

TEST_CASE("Collateral token allowances", "[token]") {
    CollateralToken token(WETH, "WETH");
    token.mint(ALICE, units(10));

    SECTION("transfer_from spends the allowance") {
        REQUIRE(token.approve(ALICE, ENGINE, units(5)));
        REQUIRE(token.transfer_from(ENGINE, ALICE, ENGINE, units(3)));
        REQUIRE(token.allowance(ALICE, ENGINE) == units(2));
        REQUIRE(token.balance_of(ENGINE) == units(3));
    }

    SECTION("transfer_from beyond the allowance fails") {
        token.approve(ALICE, ENGINE, units(2));
        REQUIRE_FALSE(token.transfer_from(ENGINE, ALICE, ENGINE, units(3)));
        REQUIRE(token.balance_of(ALICE) == units(10));
        REQUIRE(token.allowance(ALICE, ENGINE) == units(2));
    }

    SECTION("Unlimited allowance is not decremented") {
        token.approve(ALICE, ENGINE, U128_MAX);
        REQUIRE(token.transfer_from(ENGINE, ALICE, BOB, units(3)));
        REQUIRE(token.allowance(ALICE, ENGINE) == U128_MAX);
    }

    SECTION("Approving the zero address is refused") {
        REQUIRE_FALSE(token.approve(ALICE, ZERO_ADDRESS, units(1)));
    }
}

TEST_CASE("Token changes roll back with the journal", "[token][journal]") {
    Journal journal;
    CollateralToken token(WETH, "WETH", 18, &journal);
    token.mint(ALICE, units(10));
    token.approve(ALICE, ENGINE, units(5));

    {
        Journal::Scope tx(journal);
        REQUIRE(token.transfer_from(ENGINE, ALICE, BOB, units(5)));
        token.mint(BOB, units(1));
        REQUIRE(token.balance_of(BOB) == units(6));
    }

    REQUIRE(token.balance_of(ALICE) == units(10));
    REQUIRE(token.balance_of(BOB) == 0);
    REQUIRE(token.allowance(ALICE, ENGINE) == units(5));
    REQUIRE(token.total_supply() == units(10));
}

TEST_CASE("Peg token ownership", "[token]") {
    PegToken peg(PEG, ENGINE);

    SECTION("Owner mints and burns") {
        REQUIRE(peg.symbol() == "PEG");
        REQUIRE(peg.mint(ENGINE, ALICE, units(100)));
        REQUIRE(peg.total_supply() == units(100));

        REQUIRE(peg.transfer(ALICE, ENGINE, units(40)));
        peg.burn(ENGINE, units(40));
        REQUIRE(peg.balance_of(ENGINE) == 0);
        REQUIRE(peg.total_supply() == units(60));
    }

    SECTION("Mint refuses the zero address and zero amounts") {
        REQUIRE_FALSE(peg.mint(ENGINE, ZERO_ADDRESS, units(1)));
        REQUIRE_FALSE(peg.mint(ENGINE, ALICE, 0));
        REQUIRE(peg.total_supply() == 0);
    }

    SECTION("Non-owners are rejected") {
        REQUIRE_THROWS_AS(peg.mint(ALICE, ALICE, units(1)), TokenError);
        REQUIRE_THROWS_AS(peg.burn(ALICE, units(1)), TokenError);
        REQUIRE_THROWS_AS(peg.transfer_ownership(ALICE, ALICE), TokenError);
    }

    SECTION("Burn limits") {
        peg.mint(ENGINE, ENGINE, units(5));
        REQUIRE_THROWS_AS(peg.burn(ENGINE, 0), TokenError);
        REQUIRE_THROWS_AS(peg.burn(ENGINE, units(6)), TokenError);
        REQUIRE(peg.balance_of(ENGINE) == units(5));
    }

    SECTION("Ownership transfer") {
        peg.transfer_ownership(ENGINE, BOB);
        REQUIRE(peg.owner() == BOB);
        REQUIRE_THROWS_AS(peg.mint(ENGINE, ALICE, units(1)), TokenError);
        REQUIRE_THROWS_AS(peg.transfer_ownership(BOB, ZERO_ADDRESS), TokenError);
    }

    SECTION("Configured symbol") {
        PegToken named(PEG, ENGINE, nullptr, "pUSD");
        REQUIRE(named.symbol() == "pUSD");
        REQUIRE(named.decimals() == 18);
    }
}
