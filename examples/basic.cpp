// Peg Engine - Basic Example
// Loads an engine configuration, opens a position and liquidates it after a price drop

#include <peg/config.hpp>
#include <peg/engine.hpp>
#include <peg/fixed_point.hpp>

#include <iostream>
#include <utility>

using namespace peg;

namespace {

EngineConfig default_config() {
    EngineConfig config;
    config.engine.address = address_from_u64(0xE0);
    config.peg.address = address_from_u64(0xB0);
    config.with_collateral(address_from_u64(0xA1), address_from_u64(0xF1))
          .set_log_level("debug");
    return config;
}

bool feed_ok(ErrorCode code, const char* what) {
    if (code != ErrorCode::OK) {
        std::cerr << "Oracle error " << to_string(code) << ": could not " << what << "\n";
        return false;
    }
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        EngineConfig config = (argc > 1) ? EngineConfig::from_file(argv[1]) : default_config();
        if (config.collateral.tokens.empty()) {
            std::cerr << "config has no collateral tokens\n";
            return 1;
        }
        configure_logging(config);

        Journal journal;
        PriceOracle oracle(config.oracle.timeout_seconds);

        const Address& feed = config.collateral.price_feeds[0];
        if (!feed_ok(oracle.register_feed(FeedConfig{feed, "ETH / USD", constants::FEED_DECIMALS}),
                     "register feed") ||
            !feed_ok(oracle.update_answer(feed, 2000LL * 100000000LL), "publish price")) {
            return 1;
        }

        CollateralToken weth(config.collateral.tokens[0], "WETH", 18, &journal);
        PegToken peg(config.peg.address, config.engine.address, &journal, config.peg.symbol);

        PegEngine engine(config.engine.address, {&weth}, {feed}, peg, oracle, journal);

        const Address alice = address_from_u64(0x1001);
        const Address bob = address_from_u64(0x1002);

        // Alice borrows at the limit, Bob stays overcollateralized
        for (const auto& [user, collateral] : {std::pair{alice, 1ULL}, std::pair{bob, 3ULL}}) {
            weth.mint(user, fp::from_units(collateral));
            weth.approve(user, engine.address(), fp::from_units(collateral));
            engine.deposit_collateral_and_mint(user, weth.address(), fp::from_units(collateral),
                                               fp::from_units(1000));
        }

        std::cout << "Alice health factor: " << fp::to_string(engine.get_health_factor(alice)) << "\n";

        if (!feed_ok(oracle.update_answer(feed, 1400LL * 100000000LL), "publish price")) {
            return 1;
        }
        std::cout << "After price drop:    " << fp::to_string(engine.get_health_factor(alice)) << "\n";

        peg.approve(bob, engine.address(), fp::from_units(1000));
        auto result = engine.liquidate(bob, alice, weth.address(), fp::from_units(1000));

        std::cout << "Bob seized " << fp::to_string(result.total_seized) << " WETH units"
                  << " (bonus " << fp::to_string(result.bonus) << ")\n";
        std::cout << "Alice debt now " << fp::to_string(engine.get_account_information(alice).total_debt)
                  << "\n";
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const EngineError& e) {
        std::cerr << "Engine error " << to_string(e.code()) << ": " << e.what() << "\n";
        return 1;
    } catch (const TokenError& e) {
        std::cerr << "Token error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
