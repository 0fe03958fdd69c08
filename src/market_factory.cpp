#include "market_factory.hpp"

#include "errors.hpp"

#include <utility>

namespace wx {

MarketFactory::MarketFactory(Identity owner, Identity address, const ProtocolConfig& cfg)
    : owner_(std::move(owner))
    , address_(std::move(address))
    , cfg_(cfg) {
    validateConfig(cfg_);
}

PredictionMarket& MarketFactory::createMarket(const Identity& creator, const MarketRequest& request, Timestamp now) {
    if (paused_) {
        throw StateError("market factory is paused");
    }
    if (request.expiry <= now) {
        throw ValidationError("market expiry must be in the future");
    }
    if (request.description.empty()) {
        throw ValidationError("market description must not be empty");
    }

    MarketParams params;
    params.description = request.description;
    params.locationId = request.locationId;
    params.dateKey = request.dateKey;
    params.expiry = request.expiry;
    params.oracle = request.oracle;
    params.type = request.type;
    params.criteria = request.criteria;
    params.creator = creator;
    params.owner = owner_;
    params.factory = address_;
    params.minBet = cfg_.minBet;
    params.minOrderAmount = cfg_.minOrderAmount;
    params.disputeWindowSeconds = cfg_.disputeWindowSeconds;
    params.feeBps = cfg_.feeBps;
    params.creatorShareBps = cfg_.creatorShareBps;

    auto market = std::make_unique<PredictionMarket>(nextId_, std::move(params));
    market->initPositionLedgers(address_);

    auto& slot = markets_[nextId_];
    slot = std::move(market);
    ++nextId_;
    return *slot;
}

void MarketFactory::pauseFactory(const Identity& caller, bool paused) {
    if (caller != owner_) {
        throw AuthorizationError(caller + " is not the factory owner");
    }
    if (paused_ == paused) {
        throw StateError(paused ? "market factory is already paused" : "market factory is not paused");
    }
    paused_ = paused;
}

PredictionMarket& MarketFactory::market(std::uint64_t marketId) {
    auto it = markets_.find(marketId);
    if (it == markets_.end()) {
        throw ValidationError("unknown market " + std::to_string(marketId));
    }
    return *it->second;
}

const PredictionMarket& MarketFactory::market(std::uint64_t marketId) const {
    auto it = markets_.find(marketId);
    if (it == markets_.end()) {
        throw ValidationError("unknown market " + std::to_string(marketId));
    }
    return *it->second;
}

const PredictionMarket* MarketFactory::find(std::uint64_t marketId) const {
    auto it = markets_.find(marketId);
    return it == markets_.end() ? nullptr : it->second.get();
}

} // namespace wx
