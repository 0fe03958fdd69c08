#include "order_book.hpp"

#include "errors.hpp"
#include "settlement_math.hpp"

#include <string>

namespace wx {

const char* orderStatusName(OrderStatus status) {
    switch (status) {
    case OrderStatus::Active:
        return "active";
    case OrderStatus::Filled:
        return "filled";
    case OrderStatus::Cancelled:
        return "cancelled";
    case OrderStatus::Expired:
        return "expired";
    }
    return "unknown";
}

void OrderBook::transition(LimitOrder& order, OrderStatus next) {
    if (order.status != OrderStatus::Active || next == OrderStatus::Active) {
        throw StateError("order " + std::to_string(order.id) + " cannot move from " +
                         orderStatusName(order.status) + " to " + orderStatusName(next));
    }
    order.status = next;
}

std::uint32_t OrderBook::bestBid(const PriceLevels& levels) {
    if (levels.empty()) {
        return 0;
    }
    return levels.rbegin()->first;
}

const LimitOrder& OrderBook::place(std::uint64_t orderId,
                                   const Identity& owner,
                                   Side side,
                                   std::uint32_t price,
                                   Amount amount,
                                   Timestamp expiry,
                                   Timestamp now) {
    if (price < kMinPrice || price > kMaxPrice) {
        throw ValidationError("order price " + std::to_string(price) + " must be between 1 and 9999 bps");
    }
    if (amount < minOrderAmount_) {
        throw InsufficientValueError("order amount " + std::to_string(amount) + " is below the minimum " +
                                     std::to_string(minOrderAmount_));
    }
    if (expiry <= now) {
        throw ValidationError("order expiry must be in the future");
    }
    if (orders_.count(orderId) != 0) {
        throw ValidationError("order id " + std::to_string(orderId) + " is already used");
    }
    Amount& volume = side == Side::Yes ? yesVolume_ : noVolume_;
    Amount nextVolume = SettlementMath::checkedAdd(volume, amount);
    Amount nextEscrow = SettlementMath::checkedAdd(escrow_, amount);
    Amount nextTotal = SettlementMath::checkedAdd(totalEscrowed_, amount);

    LimitOrder order;
    order.id = orderId;
    order.owner = owner;
    order.side = side;
    order.price = price;
    order.amount = amount;
    order.expiry = expiry;
    order.createdAt = now;

    auto it = orders_.emplace(orderId, std::move(order)).first;
    levels(side)[price]++;
    activeCount_++;
    volume = nextVolume;
    escrow_ = nextEscrow;
    totalEscrowed_ = nextTotal;
    return it->second;
}

Amount OrderBook::cancel(const Identity& caller, std::uint64_t orderId, Timestamp now) {
    auto it = orders_.find(orderId);
    if (it == orders_.end()) {
        throw ValidationError("unknown order " + std::to_string(orderId));
    }
    LimitOrder& order = it->second;
    if (order.owner != caller) {
        throw AuthorizationError(caller + " does not own order " + std::to_string(orderId));
    }
    if (order.status != OrderStatus::Active) {
        throw StateError("order " + std::to_string(orderId) + " is " + orderStatusName(order.status));
    }
    if (order.amount > escrow_) {
        throw InvariantViolation("order escrow does not cover order " + std::to_string(orderId));
    }

    transition(order, now >= order.expiry ? OrderStatus::Expired : OrderStatus::Cancelled);
    order.closedAt = now;

    PriceLevels& sideLevels = levels(order.side);
    auto level = sideLevels.find(order.price);
    if (level != sideLevels.end() && --level->second == 0) {
        sideLevels.erase(level);
    }
    Amount& volume = order.side == Side::Yes ? yesVolume_ : noVolume_;
    volume -= order.amount;
    escrow_ -= order.amount;
    activeCount_--;
    totalReleased_ = SettlementMath::checkedAdd(totalReleased_, order.amount);
    return order.amount;
}

std::optional<LimitOrder> OrderBook::getOrder(std::uint64_t orderId) const {
    auto it = orders_.find(orderId);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

OrderBookSnapshot OrderBook::snapshot() const {
    OrderBookSnapshot out;
    out.bestYesBid = bestBid(yesLevels_);
    out.bestNoBid = bestBid(noLevels_);
    out.activeOrderCount = activeCount_;
    out.totalYesBidVolume = yesVolume_;
    out.totalNoBidVolume = noVolume_;
    out.escrowHeld = escrow_;
    return out;
}

} // namespace wx
