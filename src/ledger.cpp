// =============================================================================
// ledger.cpp - Collateral and debt positions
// =============================================================================

#include "peg/ledger.hpp"
#include "peg/fixed_point.hpp"

namespace peg {

// =============================================================================
// CollateralLedger
// =============================================================================

CollateralLedger::CollateralLedger(Journal& journal) : journal_(journal) {}

void CollateralLedger::increment(const Address& user, const Address& asset, Amount amount) {
    Amount balance = fp::checked_add(balance_of(user, asset), amount);
    // Total overflow is checked before any write
    fp::checked_add(total_deposited(asset), amount);
    set(user, asset, balance);
}

void CollateralLedger::decrement(const Address& user, const Address& asset, Amount amount) {
    Amount balance = balance_of(user, asset);
    if (balance < amount) {
        throw EngineError(ErrorCode::INSUFFICIENT_BALANCE,
                          "collateral balance " + fp::to_string(balance) +
                          " of " + to_hex(user) + " is below " + fp::to_string(amount));
    }
    set(user, asset, balance - amount);
}

Amount CollateralLedger::balance_of(const Address& user, const Address& asset) const {
    auto uit = positions_.find(user);
    if (uit == positions_.end()) return 0;
    auto ait = uit->second.find(asset);
    return (ait != uit->second.end()) ? ait->second : 0;
}

Amount CollateralLedger::total_deposited(const Address& asset) const {
    auto it = totals_.find(asset);
    return (it != totals_.end()) ? it->second : 0;
}

void CollateralLedger::set(const Address& user, const Address& asset, Amount amount) {
    Amount previous = balance_of(user, asset);
    Amount previous_total = total_deposited(asset);

    positions_[user][asset] = amount;
    totals_[asset] = previous_total - previous + amount;

    journal_.record([this, user, asset, previous, previous_total]() {
        positions_[user][asset] = previous;
        totals_[asset] = previous_total;
    });
}

// =============================================================================
// DebtLedger
// =============================================================================

DebtLedger::DebtLedger(Journal& journal) : journal_(journal) {}

void DebtLedger::increment(const Address& user, Amount amount) {
    Amount debt = fp::checked_add(debt_of(user), amount);
    fp::checked_add(total_, amount);
    set(user, debt);
}

void DebtLedger::decrement(const Address& user, Amount amount) {
    Amount debt = debt_of(user);
    if (debt < amount) {
        throw EngineError(ErrorCode::INSUFFICIENT_BALANCE,
                          "debt " + fp::to_string(debt) + " of " + to_hex(user) +
                          " is below " + fp::to_string(amount));
    }
    set(user, debt - amount);
}

Amount DebtLedger::debt_of(const Address& user) const {
    auto it = debts_.find(user);
    return (it != debts_.end()) ? it->second : 0;
}

void DebtLedger::set(const Address& user, Amount amount) {
    Amount previous = debt_of(user);
    Amount previous_total = total_;

    debts_[user] = amount;
    total_ = previous_total - previous + amount;

    journal_.record([this, user, previous, previous_total]() {
        debts_[user] = previous;
        total_ = previous_total;
    });
}

} // namespace peg
