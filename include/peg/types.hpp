#ifndef PEG_TYPES_HPP
#define PEG_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>
#include <optional>
#include <limits>

namespace peg {

// =============================================================================
// Addresses (EVM-style 20-byte identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

constexpr Address ZERO_ADDRESS = {};

constexpr bool is_zero_address(const Address& a) {
    for (auto b : a) {
        if (b != 0) return false;
    }
    return true;
}

// Build an address whose low 8 bytes hold `n` (test and config helper)
constexpr Address address_from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

std::string to_hex(const Address& addr);
std::optional<Address> address_from_hex(std::string_view hex);

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Amounts
// =============================================================================

using U128 = unsigned __int128;

// Token amounts and USD values (18-decimal fixed point unless noted)
using Amount = U128;

constexpr U128 U128_MAX = std::numeric_limits<U128>::max();

// =============================================================================
// Engine Constants
// =============================================================================

namespace constants {
constexpr U128 PRECISION = 1000000000000000000ULL;           // 1e18
constexpr U128 ADDITIONAL_FEED_PRECISION = 10000000000ULL;   // 1e10
constexpr U128 FEED_PRECISION = 100000000ULL;                // 1e8
constexpr uint8_t FEED_DECIMALS = 8;
constexpr U128 LIQUIDATION_THRESHOLD = 50;                   // 200% overcollateralized
constexpr U128 LIQUIDATION_PRECISION = 100;
constexpr U128 LIQUIDATION_BONUS = 10;                       // 10%
constexpr U128 MIN_HEALTH_FACTOR = PRECISION;                // 1.0
constexpr uint64_t ORACLE_TIMEOUT_SECONDS = 3 * 60 * 60;     // 3 hours
}

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,
    INVALID_AMOUNT = -1,
    ASSET_NOT_SUPPORTED = -2,
    TRANSFER_FAILED = -3,
    INSUFFICIENT_BALANCE = -4,
    MINT_FAILED = -5,
    BREAKS_HEALTH_FACTOR = -6,
    HEALTH_FACTOR_OKAY = -7,
    HEALTH_FACTOR_NOT_IMPROVED = -8,
    ORACLE_UNAVAILABLE = -20,
    STALE_PRICE = -21,
    TOKEN_AND_FEED_LENGTH_MISMATCH = -22,
    INVALID_CONFIGURATION = -23,
    REENTRANCY = -30,
    ARITHMETIC_OVERFLOW = -31,
};

const char* to_string(ErrorCode code) noexcept;

// Engine failure. Aborts the enclosing operation.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    EngineError(ErrorCode code, const std::string& msg, U128 health_factor)
        : std::runtime_error(msg), code_(code), health_factor_(health_factor) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    // Set only for BREAKS_HEALTH_FACTOR
    [[nodiscard]] std::optional<U128> health_factor() const noexcept { return health_factor_; }

private:
    ErrorCode code_;
    std::optional<U128> health_factor_;
};

// Misuse of an in-memory token ledger (owner checks, burn limits)
class TokenError : public std::runtime_error {
public:
    explicit TokenError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace peg

#endif // PEG_TYPES_HPP
