#ifndef PEG_TOKEN_HPP
#define PEG_TOKEN_HPP

#include <string>
#include <unordered_map>

#include "types.hpp"
#include "journal.hpp"

namespace peg {

// =============================================================================
// Token Interfaces
// =============================================================================

// Fungible token with standard transfer semantics. The caller/spender is passed
// explicitly; failures are reported through the return value.
class IToken {
public:
    virtual ~IToken() = default;

    virtual const Address& address() const = 0;
    virtual Amount balance_of(const Address& owner) const = 0;

    // Move `amount` from `caller` to `to`
    virtual bool transfer(const Address& caller, const Address& to, Amount amount) = 0;

    // Move `amount` from `from` to `to` using `spender`'s allowance
    virtual bool transfer_from(const Address& spender, const Address& from,
                               const Address& to, Amount amount) = 0;
};

// Issued-asset ledger: supply is created and destroyed by its owner
class IStableToken : public virtual IToken {
public:
    virtual bool mint(const Address& caller, const Address& to, Amount amount) = 0;

    // Burns from the caller's own balance
    virtual void burn(const Address& caller, Amount amount) = 0;
};

// =============================================================================
// TokenLedger - In-memory ERC20 balances and allowances
// =============================================================================

class TokenLedger : public virtual IToken {
public:
    // With a journal attached, every balance/allowance change made inside an open
    // scope is undone if that scope rolls back.
    TokenLedger(const Address& address, std::string symbol, uint8_t decimals = 18,
                Journal* journal = nullptr);
    ~TokenLedger() override = default;

    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    const Address& address() const override { return address_; }
    const std::string& symbol() const { return symbol_; }
    uint8_t decimals() const { return decimals_; }

    Amount balance_of(const Address& owner) const override;
    Amount allowance(const Address& owner, const Address& spender) const;
    Amount total_supply() const { return total_supply_; }

    bool transfer(const Address& caller, const Address& to, Amount amount) override;
    bool transfer_from(const Address& spender, const Address& from,
                       const Address& to, Amount amount) override;
    bool approve(const Address& owner, const Address& spender, Amount amount);

protected:
    // Supply changes for subclasses; `destroy` returns false on insufficient balance
    void issue(const Address& to, Amount amount);
    bool destroy(const Address& from, Amount amount);

private:
    void set_balance(const Address& owner, Amount amount);
    void set_allowance(const Address& owner, const Address& spender, Amount amount);
    void set_supply(Amount amount);

    Address address_;
    std::string symbol_;
    uint8_t decimals_;
    Journal* journal_;

    std::unordered_map<Address, Amount, AddressHash> balances_;
    std::unordered_map<Address, std::unordered_map<Address, Amount, AddressHash>, AddressHash> allowances_;
    Amount total_supply_ = 0;
};

// =============================================================================
// CollateralToken - Freely mintable collateral asset (wrapped ETH/BTC style)
// =============================================================================

class CollateralToken : public TokenLedger {
public:
    using TokenLedger::TokenLedger;

    void mint(const Address& to, Amount amount) { issue(to, amount); }
};

// =============================================================================
// PegToken - The issued, pegged unit of account
// =============================================================================

class PegToken : public TokenLedger, public IStableToken {
public:
    PegToken(const Address& address, const Address& owner, Journal* journal = nullptr,
             std::string symbol = "PEG");

    const Address& owner() const { return owner_; }
    void transfer_ownership(const Address& caller, const Address& new_owner);

    // Owner only. Returns false for the zero address or a zero amount.
    bool mint(const Address& caller, const Address& to, Amount amount) override;

    // Owner only. Throws TokenError for a zero amount or more than the balance.
    void burn(const Address& caller, Amount amount) override;

private:
    void require_owner(const Address& caller) const;

    Address owner_;
};

} // namespace peg

#endif // PEG_TOKEN_HPP
