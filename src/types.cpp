// =============================================================================
// types.cpp - Address encoding and error names
// =============================================================================

#include "peg/types.hpp"

namespace peg {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(const Address& addr) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> address_from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_AMOUNT: return "InvalidAmount";
        case ErrorCode::ASSET_NOT_SUPPORTED: return "AssetNotSupported";
        case ErrorCode::TRANSFER_FAILED: return "TransferFailed";
        case ErrorCode::INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case ErrorCode::MINT_FAILED: return "MintFailed";
        case ErrorCode::BREAKS_HEALTH_FACTOR: return "BreaksHealthFactor";
        case ErrorCode::HEALTH_FACTOR_OKAY: return "HealthFactorOkay";
        case ErrorCode::HEALTH_FACTOR_NOT_IMPROVED: return "HealthFactorNotImproved";
        case ErrorCode::ORACLE_UNAVAILABLE: return "OracleUnavailable";
        case ErrorCode::STALE_PRICE: return "StalePrice";
        case ErrorCode::TOKEN_AND_FEED_LENGTH_MISMATCH: return "TokenAndFeedLengthMismatch";
        case ErrorCode::INVALID_CONFIGURATION: return "InvalidConfiguration";
        case ErrorCode::REENTRANCY: return "Reentrancy";
        case ErrorCode::ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
    }
    return "Unknown";
}

} // namespace peg
