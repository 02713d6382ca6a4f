// Peg Engine - Shared test fixtures

#ifndef PEG_TESTS_FIXTURES_HPP
#define PEG_TESTS_FIXTURES_HPP

#include <functional>
#include <string>

#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>

#include <peg/engine.hpp>
#include <peg/fixed_point.hpp>

namespace Catch {
template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 v) { return peg::fp::to_string(v); }
};
} // namespace Catch

namespace peg::test {

inline constexpr uint64_t GENESIS = 1'700'000'000;

inline constexpr Address ENGINE = address_from_u64(0xE0);
inline constexpr Address ALICE = address_from_u64(0x1001);
inline constexpr Address BOB = address_from_u64(0x1002);
inline constexpr Address CAROL = address_from_u64(0x1003);

inline constexpr Address WETH = address_from_u64(0xA1);
inline constexpr Address WBTC = address_from_u64(0xA2);
inline constexpr Address PEG = address_from_u64(0xB0);
inline constexpr Address WETH_FEED = address_from_u64(0xF1);
inline constexpr Address WBTC_FEED = address_from_u64(0xF2);

constexpr Amount units(uint64_t whole) { return fp::from_units(whole); }

// Feed answer with FEED_DECIMALS
constexpr int64_t usd_price(int64_t whole) { return whole * 100000000LL; }

inline auto has_code(ErrorCode code) {
    return Catch::Matchers::Predicate<EngineError>(
        [code](const EngineError& e) { return e.code() == code; },
        std::string("error code ") + to_string(code));
}

// Collateral token whose transfers can be failed or intercepted
class HookedToken : public CollateralToken {
public:
    using CollateralToken::CollateralToken;

    bool fail_transfer = false;
    bool fail_transfer_from = false;
    std::function<void()> on_transfer_from;

    bool transfer(const Address& caller, const Address& to, Amount amount) override {
        if (fail_transfer) return false;
        return CollateralToken::transfer(caller, to, amount);
    }

    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, Amount amount) override {
        if (on_transfer_from) on_transfer_from();
        if (fail_transfer_from) return false;
        return CollateralToken::transfer_from(spender, from, to, amount);
    }
};

// Peg token whose mint can be refused
class HookedPegToken : public PegToken {
public:
    using PegToken::PegToken;

    bool fail_mint = false;

    bool mint(const Address& caller, const Address& to, Amount amount) override {
        if (fail_mint) return false;
        return PegToken::mint(caller, to, amount);
    }
};

// Oracle, two collateral assets (WETH at 2000, WBTC at 30000), the peg token and
// the engine, all sharing one journal and a controllable clock.
struct World {
    Journal journal;
    PriceOracle oracle;
    uint64_t clock = GENESIS;

    HookedToken weth{WETH, "WETH", 18, &journal};
    HookedToken wbtc{WBTC, "WBTC", 18, &journal};
    HookedPegToken peg{PEG, ENGINE, &journal};

    PegEngine engine{ENGINE, {&weth, &wbtc}, {WETH_FEED, WBTC_FEED}, peg, oracle, journal};

    World() {
        oracle.set_clock([this]() { return clock; });
        oracle.register_feed(FeedConfig{WETH_FEED, "ETH / USD", constants::FEED_DECIMALS});
        oracle.register_feed(FeedConfig{WBTC_FEED, "BTC / USD", constants::FEED_DECIMALS});
        set_price(WETH_FEED, 2000);
        set_price(WBTC_FEED, 30000);
    }

    void set_price(const Address& feed, int64_t whole_usd) {
        oracle.update_answer(feed, usd_price(whole_usd), clock);
    }

    void advance(uint64_t seconds) { clock += seconds; }

    // Mint collateral to `user` and approve the engine for it
    void fund(HookedToken& token, const Address& user, Amount amount) {
        token.mint(user, amount);
        token.approve(user, ENGINE, token.allowance(user, ENGINE) + amount);
    }

    void approve_peg(const Address& user, Amount amount) {
        peg.approve(user, ENGINE, amount);
    }

    // Deposit `collateral` WETH and mint `debt` peg in one operation
    void open_position(const Address& user, Amount collateral, Amount debt) {
        fund(weth, user, collateral);
        engine.deposit_collateral_and_mint(user, WETH, collateral, debt);
    }
};

} // namespace peg::test

#endif // PEG_TESTS_FIXTURES_HPP
