// =============================================================================
// risk.cpp - RiskEngine valuation and solvency checks
// =============================================================================

#include "peg/risk.hpp"
#include "peg/fixed_point.hpp"

namespace peg {

using namespace constants;

RiskEngine::RiskEngine(const AssetRegistry& registry, const CollateralLedger& collateral,
                       const DebtLedger& debt, const IPriceOracle& oracle)
    : registry_(registry), collateral_(collateral), debt_(debt), oracle_(oracle) {}

// =============================================================================
// Conversions
// =============================================================================

U128 RiskEngine::price_x18(const Address& asset) const {
    const CollateralAsset& entry = registry_.get(asset);

    auto quote = oracle_.latest_price(entry.price_feed);
    if (!quote) {
        throw EngineError(ErrorCode::ORACLE_UNAVAILABLE,
                          "no price for feed " + to_hex(entry.price_feed));
    }
    if (quote->is_stale) {
        throw EngineError(ErrorCode::STALE_PRICE,
                          "stale price for feed " + to_hex(entry.price_feed));
    }
    if (quote->price <= 0) {
        throw EngineError(ErrorCode::ORACLE_UNAVAILABLE,
                          "non-positive price " + std::to_string(quote->price) +
                          " for feed " + to_hex(entry.price_feed));
    }

    return static_cast<U128>(quote->price) * ADDITIONAL_FEED_PRECISION;
}

Amount RiskEngine::value_of(const Address& asset, Amount amount) const {
    return fp::mul_div(price_x18(asset), amount, PRECISION);
}

Amount RiskEngine::amount_from_usd(const Address& asset, Amount usd) const {
    return fp::mul_div(usd, PRECISION, price_x18(asset));
}

// =============================================================================
// Account Valuation
// =============================================================================

Amount RiskEngine::total_collateral_value(const Address& user) const {
    Amount total = 0;
    for (const auto& asset : registry_.assets()) {
        Amount balance = collateral_.balance_of(user, asset);
        if (balance == 0) continue;
        total = fp::checked_add(total, value_of(asset, balance));
    }
    return total;
}

AccountInformation RiskEngine::account_information(const Address& user) const {
    return AccountInformation{debt_.debt_of(user), total_collateral_value(user)};
}

Amount RiskEngine::health_factor(const Address& user) const {
    Amount debt = debt_.debt_of(user);
    if (debt == 0) return U128_MAX;
    return calculate_health_factor(debt, total_collateral_value(user));
}

Amount RiskEngine::calculate_health_factor(Amount total_debt, Amount collateral_value_usd) {
    if (total_debt == 0) return U128_MAX;

    Amount adjusted = fp::mul_div(collateral_value_usd, LIQUIDATION_THRESHOLD, LIQUIDATION_PRECISION);
    return fp::mul_div_saturating(adjusted, PRECISION, total_debt);
}

void RiskEngine::assert_healthy(const Address& user) const {
    Amount hf = health_factor(user);
    if (hf < MIN_HEALTH_FACTOR) {
        throw EngineError(ErrorCode::BREAKS_HEALTH_FACTOR,
                          "health factor " + fp::to_string(hf) + " of " + to_hex(user) +
                          " is below the minimum", hf);
    }
}

} // namespace peg
