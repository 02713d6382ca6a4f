#ifndef PEG_ORACLE_HPP
#define PEG_ORACLE_HPP

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace peg {

// =============================================================================
// Price Quote
// =============================================================================

struct PriceQuote {
    int64_t price;      // USD per whole unit, FEED_DECIMALS fixed point
    bool is_stale;
};

// =============================================================================
// Oracle Adapter Interface
// =============================================================================

class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    // Latest quote for a feed; nullopt when the feed has never reported
    virtual std::optional<PriceQuote> latest_price(const Address& feed) const = 0;
};

// =============================================================================
// Round Data (aggregator layout)
// =============================================================================

struct RoundData {
    uint64_t round_id;
    int64_t answer;
    uint64_t started_at;
    uint64_t updated_at;
    uint64_t answered_in_round;
};

struct FeedConfig {
    Address feed;
    std::string description;    // e.g. "ETH / USD"
    uint8_t decimals;
};

// =============================================================================
// PriceOracle - Aggregator store with staleness enforcement
// =============================================================================

class PriceOracle : public IPriceOracle {
public:
    using Clock = std::function<uint64_t()>;  // unix seconds

    explicit PriceOracle(uint64_t timeout_seconds = constants::ORACLE_TIMEOUT_SECONDS);
    ~PriceOracle() override = default;

    PriceOracle(const PriceOracle&) = delete;
    PriceOracle& operator=(const PriceOracle&) = delete;

    // =========================================================================
    // Configuration
    // =========================================================================

    ErrorCode register_feed(const FeedConfig& config);
    bool feed_exists(const Address& feed) const;
    std::optional<FeedConfig> get_config(const Address& feed) const;

    void set_clock(Clock clock);
    uint64_t now() const;

    uint64_t timeout() const { return timeout_seconds_; }
    void set_timeout(uint64_t seconds) { timeout_seconds_ = seconds; }

    // =========================================================================
    // Price Updates
    // =========================================================================

    // Publish a new round. A zero timestamp means "now".
    ErrorCode update_answer(const Address& feed, int64_t answer, uint64_t timestamp = 0);

    // Publish a round verbatim (used to model incomplete or carried-over rounds)
    ErrorCode update_round_data(const Address& feed, const RoundData& round);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<RoundData> latest_round_data(const Address& feed) const;
    std::optional<RoundData> get_round_data(const Address& feed, uint64_t round_id) const;

    std::optional<PriceQuote> latest_price(const Address& feed) const override;

    bool is_stale(const RoundData& round) const;
    uint64_t price_age(const Address& feed) const;

    struct Stats {
        uint64_t total_feeds;
        uint64_t total_updates;
    };
    Stats get_stats() const;

private:
    struct FeedState {
        FeedConfig config;
        std::vector<RoundData> rounds;
    };

    std::unordered_map<Address, FeedState, AddressHash> feeds_;
    uint64_t timeout_seconds_;
    uint64_t total_updates_ = 0;
    Clock clock_;
};

} // namespace peg

#endif // PEG_ORACLE_HPP
