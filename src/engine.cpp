// =============================================================================
// engine.cpp - PegEngine collateral, issuance and liquidation
// =============================================================================

#include "peg/engine.hpp"
#include "peg/fixed_point.hpp"

#include <spdlog/spdlog.h>

#include <type_traits>
#include <utility>

namespace peg {

using namespace constants;

namespace {

void require_positive(Amount amount) {
    if (amount == 0) {
        throw EngineError(ErrorCode::INVALID_AMOUNT, "amount must be more than zero");
    }
}

// Marks the engine busy for the duration of one operation
class ReentrancyGuard {
public:
    ReentrancyGuard(bool& entered, const char* operation) : entered_(entered) {
        if (entered_) {
            throw EngineError(ErrorCode::REENTRANCY,
                              std::string("reentrant call to ") + operation);
        }
        entered_ = true;
    }
    ~ReentrancyGuard() { entered_ = false; }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    bool& entered_;
};

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PegEngine::PegEngine(const Address& self,
                     const std::vector<IToken*>& collateral_tokens,
                     const std::vector<Address>& price_feeds,
                     IStableToken& peg_token,
                     const IPriceOracle& oracle,
                     Journal& journal)
    : self_(self),
      registry_(collateral_tokens, price_feeds),
      peg_token_(peg_token),
      journal_(journal),
      collateral_(journal),
      debt_(journal),
      risk_(registry_, collateral_, debt_, oracle) {
    spdlog::info("peg engine {} ready with {} collateral assets, peg token {}",
                 to_hex(self_), registry_.size(), to_hex(peg_token_.address()));
}

// =============================================================================
// Collateral
// =============================================================================

void PegEngine::deposit_collateral(const Address& caller, const Address& asset, Amount amount) {
    execute("deposit_collateral", [&]() {
        deposit_internal(caller, asset, amount);
    });
}

void PegEngine::redeem_collateral(const Address& caller, const Address& asset, Amount amount) {
    execute("redeem_collateral", [&]() {
        redeem_internal(caller, caller, asset, amount);
        risk_.assert_healthy(caller);
    });
}

// =============================================================================
// Peg Issuance
// =============================================================================

void PegEngine::mint(const Address& caller, Amount amount) {
    execute("mint", [&]() {
        mint_internal(caller, amount);
    });
}

void PegEngine::burn(const Address& caller, Amount amount) {
    execute("burn", [&]() {
        burn_internal(caller, caller, amount);
        risk_.assert_healthy(caller);
    });
}

// =============================================================================
// Compositions
// =============================================================================

void PegEngine::deposit_collateral_and_mint(const Address& caller, const Address& asset,
                                            Amount collateral_amount, Amount mint_amount) {
    execute("deposit_collateral_and_mint", [&]() {
        deposit_internal(caller, asset, collateral_amount);
        mint_internal(caller, mint_amount);
    });
}

void PegEngine::redeem_collateral_for_burn(const Address& caller, const Address& asset,
                                           Amount collateral_amount, Amount burn_amount) {
    execute("redeem_collateral_for_burn", [&]() {
        require_positive(collateral_amount);
        registry_.get(asset);
        burn_internal(caller, caller, burn_amount);
        redeem_internal(caller, caller, asset, collateral_amount);
        risk_.assert_healthy(caller);
    });
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult PegEngine::liquidate(const Address& liquidator, const Address& user,
                                       const Address& asset, Amount debt_to_cover) {
    LiquidationResult result{};

    execute("liquidate", [&]() {
        require_positive(debt_to_cover);
        registry_.get(asset);

        Amount starting_hf = risk_.health_factor(user);
        if (starting_hf >= MIN_HEALTH_FACTOR) {
            throw EngineError(ErrorCode::HEALTH_FACTOR_OKAY,
                              "health factor " + fp::to_string(starting_hf) + " of " +
                              to_hex(user) + " is not below the minimum");
        }

        Amount seized = risk_.amount_from_usd(asset, debt_to_cover);
        Amount bonus = fp::mul_div(seized, LIQUIDATION_BONUS, LIQUIDATION_PRECISION);
        Amount total_seized = fp::checked_add(seized, bonus);

        // Below 100% collateralization the bonus may exceed what the user holds;
        // the decrement then fails and the liquidation is rejected.
        redeem_internal(user, liquidator, asset, total_seized);
        burn_internal(user, liquidator, debt_to_cover);

        Amount ending_hf = risk_.health_factor(user);
        if (ending_hf <= starting_hf) {
            throw EngineError(ErrorCode::HEALTH_FACTOR_NOT_IMPROVED,
                              "health factor of " + to_hex(user) + " moved from " +
                              fp::to_string(starting_hf) + " to " + fp::to_string(ending_hf));
        }
        risk_.assert_healthy(liquidator);

        result = LiquidationResult{liquidator, user, asset, debt_to_cover,
                                   seized, bonus, total_seized, starting_hf, ending_hf};
        emit(Liquidated{liquidator, user, asset, debt_to_cover, total_seized});
        count(&Stats::liquidations);
    });

    return result;
}

// =============================================================================
// Queries
// =============================================================================

Amount PegEngine::get_collateral_balance_of_user(const Address& user, const Address& asset) const {
    return collateral_.balance_of(user, asset);
}

AccountInformation PegEngine::get_account_information(const Address& user) const {
    return risk_.account_information(user);
}

Amount PegEngine::get_account_collateral_value(const Address& user) const {
    return risk_.total_collateral_value(user);
}

Amount PegEngine::get_usd_value(const Address& asset, Amount amount) const {
    return risk_.value_of(asset, amount);
}

Amount PegEngine::get_token_amount_from_usd(const Address& asset, Amount usd) const {
    return risk_.amount_from_usd(asset, usd);
}

Amount PegEngine::get_health_factor(const Address& user) const {
    return risk_.health_factor(user);
}

const Address& PegEngine::get_collateral_token_price_feed(const Address& asset) const {
    return registry_.get(asset).price_feed;
}

void PegEngine::set_event_callback(EventCallback callback) {
    event_callback_ = std::move(callback);
}

// =============================================================================
// Internal Transitions
// =============================================================================

void PegEngine::execute(const char* operation, const std::function<void()>& body) {
    try {
        ReentrancyGuard guard(entered_, operation);
        Journal::Scope tx(journal_);
        body();
        tx.commit();
    } catch (const EngineError& e) {
        ++stats_.rejected;
        spdlog::warn("{} rejected: {} ({})", operation, to_string(e.code()), e.what());
        throw;
    } catch (const TokenError& e) {
        ++stats_.rejected;
        spdlog::warn("{} rejected by token: {}", operation, e.what());
        throw;
    }

    // Committed and unlocked: callbacks may call back into the engine
    deliver(operation);
}

void PegEngine::deposit_internal(const Address& user, const Address& asset, Amount amount) {
    require_positive(amount);
    const CollateralAsset& entry = registry_.get(asset);

    collateral_.increment(user, asset, amount);
    emit(CollateralDeposited{user, asset, amount});

    if (!entry.token->transfer_from(self_, user, self_, amount)) {
        throw EngineError(ErrorCode::TRANSFER_FAILED,
                          "collateral transfer from " + to_hex(user) + " failed");
    }
    count(&Stats::deposits);
}

void PegEngine::mint_internal(const Address& user, Amount amount) {
    require_positive(amount);

    debt_.increment(user, amount);
    risk_.assert_healthy(user);

    if (!peg_token_.mint(self_, user, amount)) {
        throw EngineError(ErrorCode::MINT_FAILED, "peg token refused to mint to " + to_hex(user));
    }
    emit(PegMinted{user, amount});
    count(&Stats::mints);
}

void PegEngine::redeem_internal(const Address& from, const Address& to,
                                const Address& asset, Amount amount) {
    require_positive(amount);
    const CollateralAsset& entry = registry_.get(asset);

    collateral_.decrement(from, asset, amount);
    emit(CollateralRedeemed{from, to, asset, amount});

    if (!entry.token->transfer(self_, to, amount)) {
        throw EngineError(ErrorCode::TRANSFER_FAILED,
                          "collateral transfer to " + to_hex(to) + " failed");
    }
    count(&Stats::redemptions);
}

void PegEngine::burn_internal(const Address& on_behalf_of, const Address& payer, Amount amount) {
    require_positive(amount);

    debt_.decrement(on_behalf_of, amount);

    if (!peg_token_.transfer_from(self_, payer, self_, amount)) {
        throw EngineError(ErrorCode::TRANSFER_FAILED,
                          "peg token transfer from " + to_hex(payer) + " failed");
    }
    peg_token_.burn(self_, amount);
    emit(PegBurned{on_behalf_of, payer, amount});
    count(&Stats::burns);
}

void PegEngine::emit(Event event) {
    journal_.defer([this, event = std::move(event)]() { committed_events_.push_back(event); });
}

void PegEngine::deliver(const char* operation) {
    std::vector<Event> events;
    events.swap(committed_events_);

    for (const auto& event : events) {
        std::visit([](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, CollateralDeposited>) {
                spdlog::debug("collateral deposited: {} {} of {}",
                              to_hex(e.user), fp::to_string(e.amount), to_hex(e.asset));
            } else if constexpr (std::is_same_v<T, CollateralRedeemed>) {
                spdlog::debug("collateral redeemed: {} -> {} {} of {}",
                              to_hex(e.from), to_hex(e.to), fp::to_string(e.amount), to_hex(e.asset));
            } else if constexpr (std::is_same_v<T, PegMinted>) {
                spdlog::debug("peg minted: {} {}", to_hex(e.user), fp::to_string(e.amount));
            } else if constexpr (std::is_same_v<T, PegBurned>) {
                spdlog::debug("peg burned: {} for {} paid by {}",
                              fp::to_string(e.amount), to_hex(e.on_behalf_of), to_hex(e.payer));
            } else {
                spdlog::info("liquidated {}: {} debt covered by {}, {} of {} seized",
                             to_hex(e.user), fp::to_string(e.debt_covered), to_hex(e.liquidator),
                             fp::to_string(e.collateral_seized), to_hex(e.asset));
            }
        }, event);

        if (!event_callback_) continue;
        try {
            event_callback_(event);
        } catch (const std::exception& e) {
            ++stats_.callback_failures;
            spdlog::error("{} event callback failed after commit: {}", operation, e.what());
        }
    }
}

void PegEngine::count(uint64_t Stats::*counter) {
    journal_.defer([this, counter]() { ++(stats_.*counter); });
}

} // namespace peg
