#ifndef PEG_LEDGER_HPP
#define PEG_LEDGER_HPP

#include <unordered_map>

#include "types.hpp"
#include "journal.hpp"

namespace peg {

// =============================================================================
// CollateralLedger - (user, asset) -> deposited amount
// =============================================================================

class CollateralLedger {
public:
    explicit CollateralLedger(Journal& journal);

    CollateralLedger(const CollateralLedger&) = delete;
    CollateralLedger& operator=(const CollateralLedger&) = delete;

    void increment(const Address& user, const Address& asset, Amount amount);

    // Throws EngineError(INSUFFICIENT_BALANCE) instead of going negative
    void decrement(const Address& user, const Address& asset, Amount amount);

    Amount balance_of(const Address& user, const Address& asset) const;

    // Sum over all users
    Amount total_deposited(const Address& asset) const;

    size_t user_count() const { return positions_.size(); }

private:
    void set(const Address& user, const Address& asset, Amount amount);

    using AssetBalances = std::unordered_map<Address, Amount, AddressHash>;

    Journal& journal_;
    std::unordered_map<Address, AssetBalances, AddressHash> positions_;
    AssetBalances totals_;
};

// =============================================================================
// DebtLedger - user -> minted debt (18 decimals)
// =============================================================================

class DebtLedger {
public:
    explicit DebtLedger(Journal& journal);

    DebtLedger(const DebtLedger&) = delete;
    DebtLedger& operator=(const DebtLedger&) = delete;

    void increment(const Address& user, Amount amount);

    // Throws EngineError(INSUFFICIENT_BALANCE) instead of going negative
    void decrement(const Address& user, Amount amount);

    Amount debt_of(const Address& user) const;
    Amount total_debt() const { return total_; }

private:
    void set(const Address& user, Amount amount);

    Journal& journal_;
    std::unordered_map<Address, Amount, AddressHash> debts_;
    Amount total_ = 0;
};

} // namespace peg

#endif // PEG_LEDGER_HPP
