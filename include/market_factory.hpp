#pragma once

#include "ledger_types.hpp"
#include "market.hpp"
#include "protocol_config.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace wx {

struct MarketRequest {
    std::string description;
    std::uint64_t locationId = 0;
    std::uint64_t dateKey = 0;
    Timestamp expiry = 0;
    Identity oracle;
    MarketType type = MarketType::Binary;
    std::string criteria;
};

class MarketFactory {
public:
    MarketFactory(Identity owner, Identity address, const ProtocolConfig& cfg);

    // Creates the market with the deployment's fee schedule and sets up its
    // position ledgers. Ids start at 1.
    PredictionMarket& createMarket(const Identity& creator, const MarketRequest& request, Timestamp now);

    void pauseFactory(const Identity& caller, bool paused);

    PredictionMarket& market(std::uint64_t marketId);
    const PredictionMarket& market(std::uint64_t marketId) const;
    const PredictionMarket* find(std::uint64_t marketId) const;

    std::size_t marketCount() const { return markets_.size(); }
    std::uint64_t nextId() const { return nextId_; }
    bool paused() const { return paused_; }
    const Identity& owner() const { return owner_; }
    const Identity& address() const { return address_; }

private:
    Identity owner_;
    Identity address_;
    ProtocolConfig cfg_;
    bool paused_ = false;
    std::uint64_t nextId_ = 1;
    std::unordered_map<std::uint64_t, std::unique_ptr<PredictionMarket>> markets_;
};

} // namespace wx
