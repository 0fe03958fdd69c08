#include "position_ledger.hpp"

#include "errors.hpp"
#include "settlement_math.hpp"

#include <string>

namespace wx {

void PositionToken::mint(const Identity& holder, Amount amount) {
    if (holder.empty()) {
        throw ValidationError("position holder must not be empty");
    }
    if (amount == 0) {
        throw ValidationError("cannot mint zero positions");
    }
    if (settlement_.settled) {
        throw StateError("outcome " + std::to_string(outcome_) + " is already settled");
    }
    Amount nextSupply = SettlementMath::checkedAdd(totalSupply_, amount);
    Amount nextBalance = SettlementMath::checkedAdd(balanceOf(holder), amount);
    wallets_[holder] = nextBalance;
    totalSupply_ = nextSupply;
}

void PositionToken::transfer(const Identity& from, const Identity& to, Amount amount) {
    if (to.empty()) {
        throw ValidationError("transfer recipient must not be empty");
    }
    if (from == to) {
        throw ValidationError("cannot transfer positions to the same holder");
    }
    if (amount == 0) {
        throw ValidationError("cannot transfer zero positions");
    }
    Amount fromBalance = balanceOf(from);
    if (fromBalance < amount) {
        throw InsufficientValueError(from + " holds " + std::to_string(fromBalance) + " of outcome " +
                                     std::to_string(outcome_) + ", cannot move " + std::to_string(amount));
    }
    Amount toBalance = SettlementMath::checkedAdd(balanceOf(to), amount);

    if (fromBalance == amount) {
        wallets_.erase(from);
    } else {
        wallets_[from] = fromBalance - amount;
    }
    wallets_[to] = toBalance;
}

Amount PositionToken::burn(const Identity& holder, Amount amount) {
    if (!settlement_.settled) {
        throw StateError("outcome " + std::to_string(outcome_) + " is not settled");
    }
    if (amount == 0) {
        throw ValidationError("cannot burn zero positions");
    }
    Amount balance = balanceOf(holder);
    if (balance < amount) {
        throw InsufficientValueError(holder + " holds " + std::to_string(balance) + " of outcome " +
                                     std::to_string(outcome_) + ", cannot burn " + std::to_string(amount));
    }
    Amount value = redemptionValue(amount);
    Amount nextRedeemed = SettlementMath::checkedAdd(redeemedValue_, value);

    if (balance == amount) {
        wallets_.erase(holder);
    } else {
        wallets_[holder] = balance - amount;
    }
    totalSupply_ -= amount;
    redeemedValue_ = nextRedeemed;
    return value;
}

void PositionToken::markSettled(bool winning, bool voided, Amount allocation) {
    if (settlement_.settled) {
        throw StateError("outcome " + std::to_string(outcome_) + " is already settled");
    }
    settlement_.settled = true;
    settlement_.winning = winning;
    settlement_.voided = voided;
    settlement_.allocation = allocation;
    settlement_.supplySnapshot = totalSupply_;
}

Amount PositionToken::redemptionValue(Amount amount) const {
    if (!settlement_.settled) {
        throw StateError("outcome " + std::to_string(outcome_) + " is not settled");
    }
    if (settlement_.supplySnapshot == 0 || settlement_.allocation == 0) {
        return 0;
    }
    return SettlementMath::mulDivFloor(amount, settlement_.allocation, settlement_.supplySnapshot);
}

Amount PositionToken::balanceOf(const Identity& holder) const {
    auto it = wallets_.find(holder);
    return it == wallets_.end() ? 0 : it->second;
}

void PositionToken::checkSupplyInvariant() const {
    Amount sum = 0;
    for (const auto& [holder, balance] : wallets_) {
        sum = SettlementMath::checkedAdd(sum, balance);
    }
    if (sum != totalSupply_) {
        throw InvariantViolation("outcome " + std::to_string(outcome_) + " supply " + std::to_string(totalSupply_) +
                                 " does not match balances " + std::to_string(sum));
    }
}

void PositionLedger::initialize(std::size_t outcomeCount) {
    if (initialized_) {
        throw StateError("position ledgers are already initialized");
    }
    if (outcomeCount < 2) {
        throw ValidationError("a market needs at least two outcomes");
    }
    tokens_.clear();
    tokens_.reserve(outcomeCount);
    for (std::size_t i = 0; i < outcomeCount; ++i) {
        tokens_.emplace_back(i);
    }
    initialized_ = true;
}

PositionToken& PositionLedger::token(std::size_t outcome) {
    if (!initialized_) {
        throw StateError("position ledgers are not initialized");
    }
    if (outcome >= tokens_.size()) {
        throw ValidationError("unknown outcome " + std::to_string(outcome));
    }
    return tokens_[outcome];
}

const PositionToken& PositionLedger::token(std::size_t outcome) const {
    if (!initialized_) {
        throw StateError("position ledgers are not initialized");
    }
    if (outcome >= tokens_.size()) {
        throw ValidationError("unknown outcome " + std::to_string(outcome));
    }
    return tokens_[outcome];
}

Amount PositionLedger::redemptionValue(std::size_t outcome, Amount amount) const {
    return token(outcome).redemptionValue(amount);
}

Amount PositionLedger::totalSupply() const {
    Amount sum = 0;
    for (const auto& token : tokens_) {
        sum = SettlementMath::checkedAdd(sum, token.totalSupply());
    }
    return sum;
}

Amount PositionLedger::outstandingClaims() const {
    Amount sum = 0;
    for (const auto& token : tokens_) {
        if (token.settlement().allocation > 0) {
            sum = SettlementMath::checkedAdd(sum, token.totalSupply());
        }
    }
    return sum;
}

} // namespace wx
