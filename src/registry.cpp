// =============================================================================
// registry.cpp - Supported collateral assets
// =============================================================================

#include "peg/registry.hpp"

namespace peg {

AssetRegistry::AssetRegistry(const std::vector<IToken*>& tokens,
                             const std::vector<Address>& price_feeds) {
    if (tokens.size() != price_feeds.size()) {
        throw EngineError(ErrorCode::TOKEN_AND_FEED_LENGTH_MISMATCH,
                          "token and price feed lists must have the same length (" +
                          std::to_string(tokens.size()) + " tokens, " +
                          std::to_string(price_feeds.size()) + " feeds)");
    }

    order_.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        IToken* token = tokens[i];
        if (token == nullptr) {
            throw EngineError(ErrorCode::INVALID_CONFIGURATION,
                              "collateral token #" + std::to_string(i) + " is null");
        }
        if (is_zero_address(price_feeds[i])) {
            throw EngineError(ErrorCode::INVALID_CONFIGURATION,
                              "collateral " + to_hex(token->address()) + " has no price feed");
        }

        const Address& asset = token->address();
        if (assets_.find(asset) != assets_.end()) {
            throw EngineError(ErrorCode::INVALID_CONFIGURATION,
                              "collateral " + to_hex(asset) + " registered twice");
        }

        assets_[asset] = CollateralAsset{asset, price_feeds[i], token};
        order_.push_back(asset);
    }
}

bool AssetRegistry::is_supported(const Address& asset) const {
    return assets_.find(asset) != assets_.end();
}

const CollateralAsset& AssetRegistry::get(const Address& asset) const {
    auto it = assets_.find(asset);
    if (it == assets_.end()) {
        throw EngineError(ErrorCode::ASSET_NOT_SUPPORTED,
                          "asset " + to_hex(asset) + " is not supported collateral");
    }
    return it->second;
}

} // namespace peg
