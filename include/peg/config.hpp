#ifndef PEG_CONFIG_HPP
#define PEG_CONFIG_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace peg {

// Unreadable or malformed configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg,
                         ErrorCode code = ErrorCode::INVALID_CONFIGURATION)
        : std::runtime_error(msg), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// =============================================================================
// Configuration Sections
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";     // trace, debug, info, warn, err, critical, off
};

struct OracleConfig {
    uint64_t timeout_seconds = constants::ORACLE_TIMEOUT_SECONDS;
};

struct PegTokenConfig {
    Address address = ZERO_ADDRESS;
    std::string symbol = "PEG";
};

struct EngineSection {
    Address address = ZERO_ADDRESS;
};

struct CollateralConfig {
    std::vector<Address> tokens;
    std::vector<Address> price_feeds;   // parallel to tokens
};

// =============================================================================
// EngineConfig
// =============================================================================

class EngineConfig {
public:
    GeneralConfig general;
    OracleConfig oracle;
    PegTokenConfig peg;
    EngineSection engine;
    CollateralConfig collateral;

    EngineConfig() = default;

    // Missing sections keep their defaults. Throws ConfigError.
    static EngineConfig from_file(std::string_view path);
    static EngineConfig parse(std::string_view content);
    static EngineConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
    std::string dump(int indent = 2) const;

    // Builder methods
    EngineConfig& with_collateral(const Address& token, const Address& price_feed) {
        collateral.tokens.push_back(token);
        collateral.price_feeds.push_back(price_feed);
        return *this;
    }

    EngineConfig& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    EngineConfig& set_oracle_timeout(uint64_t seconds) {
        oracle.timeout_seconds = seconds;
        return *this;
    }

    // Throws ConfigError(TOKEN_AND_FEED_LENGTH_MISMATCH) or
    // ConfigError(INVALID_CONFIGURATION)
    void validate() const;
};

// Applies general.log_level to the default spdlog logger
void configure_logging(const EngineConfig& config);

} // namespace peg

#endif // PEG_CONFIG_HPP
