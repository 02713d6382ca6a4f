#ifndef PEG_REGISTRY_HPP
#define PEG_REGISTRY_HPP

#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "token.hpp"

namespace peg {

// =============================================================================
// AssetRegistry - Supported collateral, fixed at construction
// =============================================================================

struct CollateralAsset {
    Address asset;
    Address price_feed;
    IToken* token;
};

class AssetRegistry {
public:
    // Throws EngineError(TOKEN_AND_FEED_LENGTH_MISMATCH) when the lists differ in
    // length and EngineError(INVALID_CONFIGURATION) for null tokens, zero feeds or
    // duplicate assets.
    AssetRegistry(const std::vector<IToken*>& tokens, const std::vector<Address>& price_feeds);

    bool is_supported(const Address& asset) const;

    // Throws EngineError(ASSET_NOT_SUPPORTED) for unknown assets
    const CollateralAsset& get(const Address& asset) const;

    // Registration order
    const std::vector<Address>& assets() const { return order_; }
    size_t size() const { return order_.size(); }

private:
    std::unordered_map<Address, CollateralAsset, AddressHash> assets_;
    std::vector<Address> order_;
};

} // namespace peg

#endif // PEG_REGISTRY_HPP
