#ifndef PEG_RISK_HPP
#define PEG_RISK_HPP

#include "types.hpp"
#include "registry.hpp"
#include "ledger.hpp"
#include "oracle.hpp"

namespace peg {

struct AccountInformation {
    Amount total_debt;              // peg units, 18 decimals
    Amount collateral_value_usd;    // USD, 18 decimals
};

// =============================================================================
// RiskEngine - Collateral valuation and health factor
// =============================================================================

class RiskEngine {
public:
    RiskEngine(const AssetRegistry& registry, const CollateralLedger& collateral,
               const DebtLedger& debt, const IPriceOracle& oracle);

    // price * ADDITIONAL_FEED_PRECISION * amount / PRECISION
    // Throws ASSET_NOT_SUPPORTED, ORACLE_UNAVAILABLE or STALE_PRICE.
    Amount value_of(const Address& asset, Amount amount) const;

    // usd * PRECISION / (price * ADDITIONAL_FEED_PRECISION)
    Amount amount_from_usd(const Address& asset, Amount usd) const;

    // Assets with a zero balance are skipped without querying the oracle
    Amount total_collateral_value(const Address& user) const;

    AccountInformation account_information(const Address& user) const;

    Amount health_factor(const Address& user) const;

    // (collateral * LIQUIDATION_THRESHOLD / LIQUIDATION_PRECISION) * PRECISION / debt,
    // U128_MAX when debt is zero
    static Amount calculate_health_factor(Amount total_debt, Amount collateral_value_usd);

    // Throws EngineError(BREAKS_HEALTH_FACTOR) carrying the computed value
    void assert_healthy(const Address& user) const;

    bool is_liquidatable(const Address& user) const {
        return health_factor(user) < constants::MIN_HEALTH_FACTOR;
    }

private:
    // Fresh, positive price scaled to 18 decimals
    U128 price_x18(const Address& asset) const;

    const AssetRegistry& registry_;
    const CollateralLedger& collateral_;
    const DebtLedger& debt_;
    const IPriceOracle& oracle_;
};

} // namespace peg

#endif // PEG_RISK_HPP
