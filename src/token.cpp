// =============================================================================
// token.cpp - In-memory token ledgers
// =============================================================================

#include "peg/token.hpp"
#include "peg/fixed_point.hpp"
#include <utility>

namespace peg {

// =============================================================================
// TokenLedger
// =============================================================================

TokenLedger::TokenLedger(const Address& address, std::string symbol, uint8_t decimals,
                         Journal* journal)
    : address_(address), symbol_(std::move(symbol)), decimals_(decimals), journal_(journal) {}

Amount TokenLedger::balance_of(const Address& owner) const {
    auto it = balances_.find(owner);
    return (it != balances_.end()) ? it->second : 0;
}

Amount TokenLedger::allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find(owner);
    if (it == allowances_.end()) return 0;
    auto sit = it->second.find(spender);
    return (sit != it->second.end()) ? sit->second : 0;
}

bool TokenLedger::transfer(const Address& caller, const Address& to, Amount amount) {
    if (is_zero_address(to)) return false;

    Amount from_balance = balance_of(caller);
    if (from_balance < amount) return false;

    set_balance(caller, from_balance - amount);
    set_balance(to, balance_of(to) + amount);
    return true;
}

bool TokenLedger::transfer_from(const Address& spender, const Address& from,
                                const Address& to, Amount amount) {
    if (is_zero_address(to)) return false;

    Amount allowed = allowance(from, spender);
    Amount from_balance = balance_of(from);
    if (allowed < amount || from_balance < amount) return false;

    // Unlimited approvals are never decremented
    if (allowed != U128_MAX) {
        set_allowance(from, spender, allowed - amount);
    }
    set_balance(from, from_balance - amount);
    set_balance(to, balance_of(to) + amount);
    return true;
}

bool TokenLedger::approve(const Address& owner, const Address& spender, Amount amount) {
    if (is_zero_address(spender)) return false;
    set_allowance(owner, spender, amount);
    return true;
}

void TokenLedger::issue(const Address& to, Amount amount) {
    if (is_zero_address(to)) {
        throw TokenError(symbol_ + ": mint to the zero address");
    }
    Amount supply = fp::checked_add(total_supply_, amount);
    set_supply(supply);
    set_balance(to, balance_of(to) + amount);
}

bool TokenLedger::destroy(const Address& from, Amount amount) {
    Amount balance = balance_of(from);
    if (balance < amount) return false;
    set_balance(from, balance - amount);
    set_supply(total_supply_ - amount);
    return true;
}

void TokenLedger::set_balance(const Address& owner, Amount amount) {
    Amount previous = balance_of(owner);
    balances_[owner] = amount;
    if (journal_) {
        journal_->record([this, owner, previous]() { balances_[owner] = previous; });
    }
}

void TokenLedger::set_allowance(const Address& owner, const Address& spender, Amount amount) {
    Amount previous = allowance(owner, spender);
    allowances_[owner][spender] = amount;
    if (journal_) {
        journal_->record([this, owner, spender, previous]() {
            allowances_[owner][spender] = previous;
        });
    }
}

void TokenLedger::set_supply(Amount amount) {
    Amount previous = total_supply_;
    total_supply_ = amount;
    if (journal_) {
        journal_->record([this, previous]() { total_supply_ = previous; });
    }
}

// =============================================================================
// PegToken
// =============================================================================

PegToken::PegToken(const Address& address, const Address& owner, Journal* journal,
                   std::string symbol)
    : TokenLedger(address, std::move(symbol), 18, journal), owner_(owner) {}

void PegToken::transfer_ownership(const Address& caller, const Address& new_owner) {
    require_owner(caller);
    if (is_zero_address(new_owner)) {
        throw TokenError(symbol() + ": new owner is the zero address");
    }
    owner_ = new_owner;
}

bool PegToken::mint(const Address& caller, const Address& to, Amount amount) {
    require_owner(caller);
    if (is_zero_address(to) || amount == 0) return false;
    issue(to, amount);
    return true;
}

void PegToken::burn(const Address& caller, Amount amount) {
    require_owner(caller);
    if (amount == 0) {
        throw TokenError(symbol() + ": burn amount must be more than zero");
    }
    if (!destroy(caller, amount)) {
        throw TokenError(symbol() + ": burn amount exceeds balance");
    }
}

void PegToken::require_owner(const Address& caller) const {
    if (caller != owner_) {
        throw TokenError(symbol() + ": caller " + to_hex(caller) + " is not the owner");
    }
}

} // namespace peg
