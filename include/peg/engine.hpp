#ifndef PEG_ENGINE_HPP
#define PEG_ENGINE_HPP

#include <functional>
#include <vector>

#include "types.hpp"
#include "journal.hpp"
#include "token.hpp"
#include "oracle.hpp"
#include "registry.hpp"
#include "ledger.hpp"
#include "risk.hpp"
#include "events.hpp"

namespace peg {

// =============================================================================
// Liquidation Result
// =============================================================================

struct LiquidationResult {
    Address liquidator;
    Address user;
    Address asset;
    Amount debt_covered;
    Amount collateral_seized;       // base amount, debt_covered converted at the oracle price
    Amount bonus;                   // LIQUIDATION_BONUS percent of the base amount
    Amount total_seized;
    Amount health_factor_before;
    Amount health_factor_after;
};

// =============================================================================
// PegEngine - Collateral custody, peg issuance and liquidation
// =============================================================================
//
// Every mutating operation runs inside one Journal scope behind a reentrancy
// guard: ledgers are updated first, notifications are queued, external token
// calls are made, and the health factor is re-validated last. Any failure rolls
// the whole operation back and re-throws. Notifications reach the callback only
// after the commit, outside the guard.

class PegEngine {
public:
    // `self` is the custody address the engine holds collateral and burns from.
    // Throws EngineError(TOKEN_AND_FEED_LENGTH_MISMATCH) on mismatched lists.
    PegEngine(const Address& self,
              const std::vector<IToken*>& collateral_tokens,
              const std::vector<Address>& price_feeds,
              IStableToken& peg_token,
              const IPriceOracle& oracle,
              Journal& journal);
    ~PegEngine() = default;

    // Non-copyable
    PegEngine(const PegEngine&) = delete;
    PegEngine& operator=(const PegEngine&) = delete;

    // =========================================================================
    // Collateral
    // =========================================================================

    // Caller must have approved the engine for `amount` of `asset`
    void deposit_collateral(const Address& caller, const Address& asset, Amount amount);

    void redeem_collateral(const Address& caller, const Address& asset, Amount amount);

    // =========================================================================
    // Peg Issuance
    // =========================================================================

    void mint(const Address& caller, Amount amount);

    // Caller must have approved the engine for `amount` of the peg token
    void burn(const Address& caller, Amount amount);

    // =========================================================================
    // Compositions
    // =========================================================================

    void deposit_collateral_and_mint(const Address& caller, const Address& asset,
                                     Amount collateral_amount, Amount mint_amount);

    // Burns first so the final health check sees the reduced debt
    void redeem_collateral_for_burn(const Address& caller, const Address& asset,
                                    Amount collateral_amount, Amount burn_amount);

    // =========================================================================
    // Liquidation
    // =========================================================================

    // Covers `debt_to_cover` of `user`'s debt with the liquidator's peg tokens and
    // pays the liquidator the equivalent collateral plus LIQUIDATION_BONUS percent.
    LiquidationResult liquidate(const Address& liquidator, const Address& user,
                                const Address& asset, Amount debt_to_cover);

    // =========================================================================
    // Queries
    // =========================================================================

    Amount get_collateral_balance_of_user(const Address& user, const Address& asset) const;
    AccountInformation get_account_information(const Address& user) const;
    Amount get_account_collateral_value(const Address& user) const;
    Amount get_usd_value(const Address& asset, Amount amount) const;
    Amount get_token_amount_from_usd(const Address& asset, Amount usd) const;
    Amount get_health_factor(const Address& user) const;

    static Amount calculate_health_factor(Amount total_debt, Amount collateral_value_usd) {
        return RiskEngine::calculate_health_factor(total_debt, collateral_value_usd);
    }

    const std::vector<Address>& get_collateral_tokens() const { return registry_.assets(); }
    const Address& get_collateral_token_price_feed(const Address& asset) const;
    const Address& get_peg_token() const { return peg_token_.address(); }
    const Address& address() const { return self_; }

    Amount total_deposited(const Address& asset) const { return collateral_.total_deposited(asset); }
    Amount total_debt() const { return debt_.total_debt(); }

    const RiskEngine& risk() const { return risk_; }

    static constexpr Amount get_precision() { return constants::PRECISION; }
    static constexpr Amount get_additional_feed_precision() { return constants::ADDITIONAL_FEED_PRECISION; }
    static constexpr Amount get_liquidation_threshold() { return constants::LIQUIDATION_THRESHOLD; }
    static constexpr Amount get_liquidation_precision() { return constants::LIQUIDATION_PRECISION; }
    static constexpr Amount get_liquidation_bonus() { return constants::LIQUIDATION_BONUS; }
    static constexpr Amount get_min_health_factor() { return constants::MIN_HEALTH_FACTOR; }

    // =========================================================================
    // Notifications
    // =========================================================================

    void set_event_callback(EventCallback callback);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t deposits;
        uint64_t redemptions;
        uint64_t mints;
        uint64_t burns;
        uint64_t liquidations;
        uint64_t rejected;
        uint64_t callback_failures;     // callbacks that threw; the operation still stands
    };
    Stats get_stats() const { return stats_; }

private:
    // Guarded, journaled execution of one public operation
    void execute(const char* operation, const std::function<void()>& body);

    // Internal transitions, composed by the public operations
    void deposit_internal(const Address& user, const Address& asset, Amount amount);
    void mint_internal(const Address& user, Amount amount);
    void redeem_internal(const Address& from, const Address& to, const Address& asset, Amount amount);
    void burn_internal(const Address& on_behalf_of, const Address& payer, Amount amount);

    // Events are queued by the journal on commit and handed to the callback by
    // deliver() once the guard is released
    void emit(Event event);
    void deliver(const char* operation);
    void count(uint64_t Stats::*counter);

    Address self_;
    AssetRegistry registry_;
    IStableToken& peg_token_;
    Journal& journal_;

    CollateralLedger collateral_;
    DebtLedger debt_;
    RiskEngine risk_;

    EventCallback event_callback_;
    std::vector<Event> committed_events_;
    bool entered_ = false;
    Stats stats_{};
};

} // namespace peg

#endif // PEG_ENGINE_HPP
