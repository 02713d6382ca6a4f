// =============================================================================
// oracle.cpp - PriceOracle aggregator store and staleness checks
// =============================================================================

#include "peg/oracle.hpp"
#include <chrono>

namespace peg {

namespace {

uint64_t system_now() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PriceOracle::PriceOracle(uint64_t timeout_seconds)
    : timeout_seconds_(timeout_seconds), clock_(system_now) {}

// =============================================================================
// Configuration
// =============================================================================

ErrorCode PriceOracle::register_feed(const FeedConfig& config) {
    if (is_zero_address(config.feed)) {
        return ErrorCode::INVALID_CONFIGURATION;
    }
    if (feeds_.find(config.feed) != feeds_.end()) {
        return ErrorCode::INVALID_CONFIGURATION;
    }

    FeedState state;
    state.config = config;
    feeds_[config.feed] = std::move(state);
    return ErrorCode::OK;
}

bool PriceOracle::feed_exists(const Address& feed) const {
    return feeds_.find(feed) != feeds_.end();
}

std::optional<FeedConfig> PriceOracle::get_config(const Address& feed) const {
    auto it = feeds_.find(feed);
    if (it == feeds_.end()) return std::nullopt;
    return it->second.config;
}

void PriceOracle::set_clock(Clock clock) {
    clock_ = clock ? std::move(clock) : Clock(system_now);
}

uint64_t PriceOracle::now() const {
    return clock_();
}

// =============================================================================
// Price Updates
// =============================================================================

ErrorCode PriceOracle::update_answer(const Address& feed, int64_t answer, uint64_t timestamp) {
    auto it = feeds_.find(feed);
    if (it == feeds_.end()) {
        return ErrorCode::ORACLE_UNAVAILABLE;
    }

    if (timestamp == 0) {
        timestamp = now();
    }

    auto& rounds = it->second.rounds;
    uint64_t round_id = rounds.empty() ? 1 : rounds.back().round_id + 1;
    rounds.push_back(RoundData{round_id, answer, timestamp, timestamp, round_id});
    ++total_updates_;
    return ErrorCode::OK;
}

ErrorCode PriceOracle::update_round_data(const Address& feed, const RoundData& round) {
    auto it = feeds_.find(feed);
    if (it == feeds_.end()) {
        return ErrorCode::ORACLE_UNAVAILABLE;
    }

    it->second.rounds.push_back(round);
    ++total_updates_;
    return ErrorCode::OK;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<RoundData> PriceOracle::latest_round_data(const Address& feed) const {
    auto it = feeds_.find(feed);
    if (it == feeds_.end() || it->second.rounds.empty()) return std::nullopt;
    return it->second.rounds.back();
}

std::optional<RoundData> PriceOracle::get_round_data(const Address& feed, uint64_t round_id) const {
    auto it = feeds_.find(feed);
    if (it == feeds_.end()) return std::nullopt;

    for (auto rit = it->second.rounds.rbegin(); rit != it->second.rounds.rend(); ++rit) {
        if (rit->round_id == round_id) return *rit;
    }
    return std::nullopt;
}

std::optional<PriceQuote> PriceOracle::latest_price(const Address& feed) const {
    auto round = latest_round_data(feed);
    if (!round) return std::nullopt;
    return PriceQuote{round->answer, is_stale(*round)};
}

bool PriceOracle::is_stale(const RoundData& round) const {
    if (round.updated_at == 0) return true;
    if (round.answered_in_round < round.round_id) return true;

    uint64_t current = now();
    // A round stamped in the future is not older than the timeout
    if (current <= round.updated_at) return false;
    return current - round.updated_at > timeout_seconds_;
}

uint64_t PriceOracle::price_age(const Address& feed) const {
    auto round = latest_round_data(feed);
    if (!round) return UINT64_MAX;

    uint64_t current = now();
    return current > round->updated_at ? current - round->updated_at : 0;
}

// =============================================================================
// Statistics
// =============================================================================

PriceOracle::Stats PriceOracle::get_stats() const {
    return Stats{feeds_.size(), total_updates_};
}

} // namespace peg
