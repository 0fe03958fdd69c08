#pragma once

#include "ledger_types.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace wx {

struct PositionSettlement {
    bool settled = false;
    bool winning = false;
    bool voided = false;
    Amount allocation = 0;
    Amount supplySnapshot = 0;
};

// Fungible claim on one outcome of one market. Only the owning market
// mints, burns and settles it.
class PositionToken {
public:
    explicit PositionToken(std::size_t outcome) : outcome_(outcome) {}

    void mint(const Identity& holder, Amount amount);
    void transfer(const Identity& from, const Identity& to, Amount amount);
    // Burns after settlement and returns the redemption value of the burned amount.
    Amount burn(const Identity& holder, Amount amount);

    // Snapshots the current supply against the allocation it will redeem for.
    void markSettled(bool winning, bool voided, Amount allocation);

    Amount redemptionValue(Amount amount) const;
    Amount balanceOf(const Identity& holder) const;
    Amount totalSupply() const { return totalSupply_; }
    Amount redeemedValue() const { return redeemedValue_; }
    std::size_t outcome() const { return outcome_; }
    std::size_t holderCount() const { return wallets_.size(); }
    const PositionSettlement& settlement() const { return settlement_; }
    const std::map<Identity, Amount>& wallets() const { return wallets_; }

    void checkSupplyInvariant() const;

private:
    std::size_t outcome_;
    std::map<Identity, Amount> wallets_;
    Amount totalSupply_ = 0;
    Amount redeemedValue_ = 0;
    PositionSettlement settlement_;
};

class PositionLedger {
public:
    bool initialized() const { return initialized_; }
    // One-time setup; a second call throws StateError.
    void initialize(std::size_t outcomeCount);

    PositionToken& token(std::size_t outcome);
    const PositionToken& token(std::size_t outcome) const;
    std::size_t outcomeCount() const { return tokens_.size(); }

    Amount redemptionValue(std::size_t outcome, Amount amount) const;
    Amount totalSupply() const;
    // Supply that still redeems for a non-zero share.
    Amount outstandingClaims() const;

private:
    bool initialized_ = false;
    std::vector<PositionToken> tokens_;
};

} // namespace wx
