#pragma once

#include "ledger_types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>

namespace wx {

enum class OrderStatus : std::uint8_t { Active = 0, Filled = 1, Cancelled = 2, Expired = 3 };

const char* orderStatusName(OrderStatus status);

struct LimitOrder {
    std::uint64_t id = 0;
    Identity owner;
    Side side = Side::Yes;
    std::uint32_t price = 0; // basis points of one unit
    Amount amount = 0;
    Timestamp expiry = 0;
    OrderStatus status = OrderStatus::Active;
    Timestamp createdAt = 0;
    Timestamp closedAt = 0;
};

struct OrderBookSnapshot {
    std::uint32_t bestYesBid = 0;
    std::uint32_t bestNoBid = 0;
    std::size_t activeOrderCount = 0;
    Amount totalYesBidVolume = 0;
    Amount totalNoBidVolume = 0;
    Amount escrowHeld = 0;
};

// Resting escrowed bids. Orders are never matched here; Filled is left for
// an external matcher.
class OrderBook {
public:
    static constexpr std::uint32_t kMinPrice = 1;
    static constexpr std::uint32_t kMaxPrice = 9'999;

    explicit OrderBook(Amount minOrderAmount) : minOrderAmount_(minOrderAmount) {}

    const LimitOrder& place(std::uint64_t orderId,
                            const Identity& owner,
                            Side side,
                            std::uint32_t price,
                            Amount amount,
                            Timestamp expiry,
                            Timestamp now);

    // Returns the escrow released back to the owner.
    Amount cancel(const Identity& caller, std::uint64_t orderId, Timestamp now);

    std::optional<LimitOrder> getOrder(std::uint64_t orderId) const;
    OrderBookSnapshot snapshot() const;
    Amount escrowHeld() const { return escrow_; }
    Amount totalEscrowed() const { return totalEscrowed_; }
    Amount totalReleased() const { return totalReleased_; }

private:
    using PriceLevels = std::map<std::uint32_t, std::size_t>;

    static void transition(LimitOrder& order, OrderStatus next);
    PriceLevels& levels(Side side) { return side == Side::Yes ? yesLevels_ : noLevels_; }
    static std::uint32_t bestBid(const PriceLevels& levels);

    Amount minOrderAmount_;
    std::unordered_map<std::uint64_t, LimitOrder> orders_;
    PriceLevels yesLevels_;
    PriceLevels noLevels_;
    std::size_t activeCount_ = 0;
    Amount yesVolume_ = 0;
    Amount noVolume_ = 0;
    Amount escrow_ = 0;
    Amount totalEscrowed_ = 0;
    Amount totalReleased_ = 0;
};

} // namespace wx
