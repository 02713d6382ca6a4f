#ifndef PEG_EVENTS_HPP
#define PEG_EVENTS_HPP

#include <functional>
#include <variant>

#include "types.hpp"

namespace peg {

// =============================================================================
// Engine Notifications (delivered after the operation commits)
// =============================================================================

struct CollateralDeposited {
    Address user;
    Address asset;
    Amount amount;
};

struct CollateralRedeemed {
    Address from;
    Address to;
    Address asset;
    Amount amount;
};

struct PegMinted {
    Address user;
    Amount amount;
};

struct PegBurned {
    Address on_behalf_of;
    Address payer;
    Amount amount;
};

struct Liquidated {
    Address liquidator;
    Address user;
    Address asset;
    Amount debt_covered;
    Amount collateral_seized;
};

using Event = std::variant<CollateralDeposited, CollateralRedeemed, PegMinted, PegBurned, Liquidated>;

using EventCallback = std::function<void(const Event&)>;

} // namespace peg

#endif // PEG_EVENTS_HPP
