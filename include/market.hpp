#pragma once

#include "ledger_types.hpp"
#include "order_book.hpp"
#include "position_ledger.hpp"
#include "resolution_criteria.hpp"
#include "settlement_math.hpp"
#include "weather_report.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace wx {

enum class MarketType : std::uint8_t { Binary = 0, Bracket = 1, Scalar = 2 };

enum class MarketStatus : std::uint8_t {
    Pending = 0,
    Active = 1,
    Expired = 2,
    Resolving = 3,
    Settled = 4,
    Disputed = 5,
    Cancelled = 6
};

const char* marketTypeName(MarketType type);
std::optional<MarketType> parseMarketType(const std::string& text);
const char* marketStatusName(MarketStatus status);

struct MarketParams {
    std::string description;
    std::uint64_t locationId = 0;
    std::uint64_t dateKey = 0;
    Timestamp expiry = 0;
    Identity oracle;
    MarketType type = MarketType::Binary;
    std::string criteria;
    Identity creator;
    Identity owner;
    Identity factory;

    Amount minBet = kUnit / 10;
    Amount minOrderAmount = kUnit / 10;
    Timestamp disputeWindowSeconds = 3'600;
    std::uint32_t feeBps = 150;
    std::uint32_t creatorShareBps = 4'000;
};

struct MarketStats {
    MarketStatus status = MarketStatus::Pending;
    bool paused = false;
    std::vector<Amount> pools;
    Amount totalPool = 0;
    Amount totalVolume = 0;
    std::size_t participants = 0;
    Amount paidOut = 0;
    Amount feesCollected = 0;
    Amount dustSwept = 0;
    Amount orderEscrow = 0;
};

struct SettlementRecord {
    bool settled = false;
    bool voided = false;
    std::optional<bool> outcome;
    std::optional<std::size_t> winningBracket;
    std::int64_t settlementValue = 0;
    std::string dataHash;
    Timestamp settledAt = 0;
    Timestamp disputeWindowEnd = 0;
    std::uint32_t reportRevision = 0;
    std::uint32_t longWeightBps = 0;
    FeeBreakdown fees;
    std::vector<Amount> allocations;
};

struct ClaimResult {
    Amount payout = 0;
    // (outcome, amount burned)
    std::vector<std::pair<std::size_t, Amount>> burned;
};

struct FeeCollection {
    Identity creator;
    Amount creatorAmount = 0;
    Identity platform;
    Amount platformAmount = 0;
};

struct PositionInfo {
    std::size_t outcome = 0;
    Amount balance = 0;
    Amount totalSupply = 0;
    bool settled = false;
    bool winning = false;
    Amount redeemable = 0;
};

// One market's lifecycle, pools, fees and claims. Every request is fully
// validated before any state changes, so a thrown error leaves the market as
// it was.
class PredictionMarket {
public:
    PredictionMarket(std::uint64_t id, MarketParams params);

    void initPositionLedgers(const Identity& caller);

    void placeBet(const Identity& bettor, Side side, std::size_t bracketIndex, Amount amount, Timestamp now);

    // Oracle-driven settlement with explicit values. outcome applies to
    // binary markets, winningBracket to bracket markets and settlementValue
    // to scalar markets.
    void settleMarket(const Identity& caller,
                      bool outcome,
                      std::size_t winningBracket,
                      std::int64_t settlementValue,
                      const std::string& dataHash,
                      Timestamp now);

    // Derives the result from a finalized report through the criteria. When
    // the report is under dispute the market moves to Disputed instead.
    MarketStatus settleFromReport(const Identity& caller, const ReportSnapshot& report, Timestamp now);

    // Anyone may ask; moves an expired market into Resolving.
    MarketStatus requestResolution(Timestamp now);
    void flagDisputed(const Identity& caller, Timestamp now);
    void cancelMarket(const Identity& caller, Timestamp now);

    ClaimResult claimWinnings(const Identity& bettor, Timestamp now);
    Amount redeemPositions(const Identity& holder, std::size_t outcome, Amount amount, Timestamp now);
    void transferPosition(const Identity& from, const Identity& to, std::size_t outcome, Amount amount);

    FeeCollection collectFees(const Identity& caller, Timestamp now);
    Amount sweepDust(const Identity& caller, Timestamp now);

    const LimitOrder& placeLimitOrder(const Identity& owner,
                                      std::uint64_t orderId,
                                      Side side,
                                      std::uint32_t price,
                                      Amount amount,
                                      Timestamp expiry,
                                      Timestamp now);
    Amount cancelLimitOrder(const Identity& owner, std::uint64_t orderId, Timestamp now);

    void setPaused(const Identity& caller, bool paused);

    std::uint64_t id() const { return id_; }
    const MarketParams& params() const { return params_; }
    const ResolutionCriteria& criteria() const { return criteria_; }
    ReportKey reportKey() const { return ReportKey{ params_.locationId, params_.dateKey }; }
    MarketStatus status() const { return status_; }
    bool paused() const { return paused_; }
    std::size_t outcomeCount() const;
    const SettlementRecord& settlement() const { return settlement_; }
    MarketStats getStats() const;
    Amount getRedemptionValue(std::size_t outcome, Amount amount) const;
    std::vector<PositionInfo> getPositionInfo(const Identity& holder) const;
    Amount balanceOf(const Identity& holder, std::size_t outcome) const;
    std::optional<LimitOrder> getOrder(std::uint64_t orderId) const { return book_.getOrder(orderId); }
    OrderBookSnapshot getOrderBook() const { return book_.snapshot(); }
    // Collateral still held for bets: pool less payouts, collected fees and swept dust.
    Amount heldBalance() const;

private:
    struct SettlementInput {
        bool outcome = false;
        std::size_t winningBracket = 0;
        std::int64_t settlementValue = 0;
        std::string dataHash;
        std::uint32_t reportRevision = 0;
    };

    static bool canTransition(MarketStatus from, MarketStatus to);
    void transition(MarketStatus next);
    // Walks the shortest legal path from the current status to target.
    void advanceTo(MarketStatus target);
    std::vector<MarketStatus> pathTo(MarketStatus target) const;

    void requireNotPaused() const;
    void requireOracle(const Identity& caller) const;
    void requireOwner(const Identity& caller) const;
    void requireSettleable(Timestamp now) const;
    void requireRedeemable(Timestamp now) const;
    std::size_t outcomeFor(Side side, std::size_t bracketIndex) const;
    void settle(const SettlementInput& input, Timestamp now);

    std::uint64_t id_;
    MarketParams params_;
    ResolutionCriteria criteria_;
    MarketStatus status_ = MarketStatus::Pending;
    bool paused_ = false;

    std::vector<Amount> pools_;
    Amount totalVolume_ = 0;
    std::set<Identity> participants_;
    PositionLedger positions_;
    OrderBook book_;

    SettlementRecord settlement_;
    Amount paidOut_ = 0;
    bool feesCollected_ = false;
    bool dustSwept_ = false;
    Amount dustAmount_ = 0;
};

} // namespace wx
