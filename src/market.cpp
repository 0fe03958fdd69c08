#include "market.hpp"

#include "errors.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <utility>

namespace wx {

namespace {

constexpr std::size_t kStatusCount = 7;

std::size_t statusIndex(MarketStatus status) {
    return static_cast<std::size_t>(status);
}

} // namespace

const char* marketTypeName(MarketType type) {
    switch (type) {
    case MarketType::Binary:
        return "binary";
    case MarketType::Bracket:
        return "bracket";
    case MarketType::Scalar:
        return "scalar";
    }
    return "unknown";
}

std::optional<MarketType> parseMarketType(const std::string& text) {
    if (text == "binary" || text == "0") {
        return MarketType::Binary;
    }
    if (text == "bracket" || text == "1") {
        return MarketType::Bracket;
    }
    if (text == "scalar" || text == "2") {
        return MarketType::Scalar;
    }
    return std::nullopt;
}

const char* marketStatusName(MarketStatus status) {
    switch (status) {
    case MarketStatus::Pending:
        return "pending";
    case MarketStatus::Active:
        return "active";
    case MarketStatus::Expired:
        return "expired";
    case MarketStatus::Resolving:
        return "resolving";
    case MarketStatus::Settled:
        return "settled";
    case MarketStatus::Disputed:
        return "disputed";
    case MarketStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

PredictionMarket::PredictionMarket(std::uint64_t id, MarketParams params)
    : id_(id)
    , params_(std::move(params))
    , criteria_(ResolutionCriteria::parse(params_.criteria))
    , book_(params_.minOrderAmount) {
    if (params_.oracle.empty() || params_.owner.empty() || params_.creator.empty()) {
        throw ValidationError("market needs an oracle, an owner and a creator");
    }
    if (params_.expiry == 0) {
        throw ValidationError("market expiry must be set");
    }
    if (params_.feeBps >= kBasisPoints || params_.creatorShareBps > kBasisPoints) {
        throw ValidationError("market fee schedule out of range");
    }
    if (params_.minBet == 0 || params_.minOrderAmount == 0) {
        throw ValidationError("market minimums must be positive");
    }

    switch (params_.type) {
    case MarketType::Binary:
        if (criteria_.kind != CriteriaKind::Binary && criteria_.kind != CriteriaKind::Manual) {
            throw ValidationError(std::string("binary market cannot use ") + criteriaKindName(criteria_.kind) +
                                  " criteria");
        }
        break;
    case MarketType::Bracket:
        if (criteria_.kind != CriteriaKind::Bracket) {
            throw ValidationError("bracket market needs bracket criteria");
        }
        break;
    case MarketType::Scalar:
        if (criteria_.kind != CriteriaKind::Scalar) {
            throw ValidationError("scalar market needs scalar criteria");
        }
        break;
    }
    pools_.assign(outcomeCount(), 0);
}

std::size_t PredictionMarket::outcomeCount() const {
    if (params_.type == MarketType::Bracket) {
        return criteria_.brackets.size();
    }
    return 2;
}

bool PredictionMarket::canTransition(MarketStatus from, MarketStatus to) {
    switch (from) {
    case MarketStatus::Pending:
        return to == MarketStatus::Active || to == MarketStatus::Cancelled;
    case MarketStatus::Active:
        return to == MarketStatus::Expired || to == MarketStatus::Cancelled;
    case MarketStatus::Expired:
        return to == MarketStatus::Resolving || to == MarketStatus::Disputed || to == MarketStatus::Cancelled;
    case MarketStatus::Resolving:
        return to == MarketStatus::Settled || to == MarketStatus::Disputed || to == MarketStatus::Cancelled;
    case MarketStatus::Disputed:
        return to == MarketStatus::Resolving || to == MarketStatus::Cancelled;
    case MarketStatus::Settled:
    case MarketStatus::Cancelled:
        return false;
    }
    return false;
}

void PredictionMarket::transition(MarketStatus next) {
    if (!canTransition(status_, next)) {
        throw StateError("market " + std::to_string(id_) + " cannot move from " + marketStatusName(status_) +
                         " to " + marketStatusName(next));
    }
    status_ = next;
}

std::vector<MarketStatus> PredictionMarket::pathTo(MarketStatus target) const {
    std::array<int, kStatusCount> previous;
    previous.fill(-1);
    std::array<bool, kStatusCount> seen{};
    std::deque<MarketStatus> queue{ status_ };
    seen[statusIndex(status_)] = true;

    while (!queue.empty()) {
        MarketStatus current = queue.front();
        queue.pop_front();
        if (current == target && current != status_) {
            break;
        }
        for (std::size_t i = 0; i < kStatusCount; ++i) {
            auto next = static_cast<MarketStatus>(i);
            if (!seen[i] && canTransition(current, next)) {
                seen[i] = true;
                previous[i] = static_cast<int>(statusIndex(current));
                queue.push_back(next);
            }
        }
    }

    if (target == status_ || !seen[statusIndex(target)]) {
        throw StateError("market " + std::to_string(id_) + " cannot move from " + marketStatusName(status_) +
                         " to " + marketStatusName(target));
    }
    std::vector<MarketStatus> path;
    for (int at = static_cast<int>(statusIndex(target)); at != static_cast<int>(statusIndex(status_));
         at = previous[static_cast<std::size_t>(at)]) {
        path.push_back(static_cast<MarketStatus>(at));
    }
    std::reverse(path.begin(), path.end());
    return path;
}

void PredictionMarket::advanceTo(MarketStatus target) {
    for (MarketStatus step : pathTo(target)) {
        transition(step);
    }
}

void PredictionMarket::requireNotPaused() const {
    if (paused_) {
        throw StateError("market " + std::to_string(id_) + " is paused");
    }
}

void PredictionMarket::requireOracle(const Identity& caller) const {
    if (caller != params_.oracle) {
        throw AuthorizationError(caller + " is not the oracle of market " + std::to_string(id_));
    }
}

void PredictionMarket::requireOwner(const Identity& caller) const {
    if (caller != params_.owner) {
        throw AuthorizationError(caller + " is not the owner of market " + std::to_string(id_));
    }
}

void PredictionMarket::requireSettleable(Timestamp now) const {
    if (now < params_.expiry) {
        throw StateError("market " + std::to_string(id_) + " has not expired");
    }
    switch (status_) {
    case MarketStatus::Active:
    case MarketStatus::Expired:
    case MarketStatus::Resolving:
    case MarketStatus::Disputed:
        return;
    case MarketStatus::Pending:
        throw StateError("market " + std::to_string(id_) + " has no position ledgers yet");
    case MarketStatus::Settled:
        throw StateError("market " + std::to_string(id_) + " is already settled");
    case MarketStatus::Cancelled:
        throw StateError("market " + std::to_string(id_) + " is cancelled");
    }
}

void PredictionMarket::requireRedeemable(Timestamp now) const {
    if (status_ == MarketStatus::Cancelled) {
        return;
    }
    if (status_ != MarketStatus::Settled) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_) + ", not settled");
    }
    if (now < settlement_.disputeWindowEnd) {
        throw StateError("market " + std::to_string(id_) + " dispute window is open until " +
                         std::to_string(settlement_.disputeWindowEnd));
    }
}

std::size_t PredictionMarket::outcomeFor(Side side, std::size_t bracketIndex) const {
    if (params_.type == MarketType::Bracket) {
        if (bracketIndex >= outcomeCount()) {
            throw ValidationError("bracket " + std::to_string(bracketIndex) + " does not exist in market " +
                                  std::to_string(id_));
        }
        return bracketIndex;
    }
    return side == Side::Yes ? 0 : 1;
}

void PredictionMarket::initPositionLedgers(const Identity& caller) {
    if (caller != params_.owner && caller != params_.factory) {
        throw AuthorizationError(caller + " cannot initialize market " + std::to_string(id_));
    }
    if (positions_.initialized()) {
        throw StateError("market " + std::to_string(id_) + " position ledgers are already initialized");
    }
    if (!canTransition(status_, MarketStatus::Active)) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_));
    }
    positions_.initialize(outcomeCount());
    transition(MarketStatus::Active);
}

void PredictionMarket::placeBet(const Identity& bettor,
                                Side side,
                                std::size_t bracketIndex,
                                Amount amount,
                                Timestamp now) {
    requireNotPaused();
    if (status_ != MarketStatus::Active) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_));
    }
    if (now >= params_.expiry) {
        throw StateError("betting on market " + std::to_string(id_) + " closed at " +
                         std::to_string(params_.expiry));
    }
    if (amount < params_.minBet) {
        throw InsufficientValueError("bet " + std::to_string(amount) + " is below the minimum " +
                                     std::to_string(params_.minBet));
    }
    const std::size_t outcome = outcomeFor(side, bracketIndex);
    Amount nextPool = SettlementMath::checkedAdd(pools_[outcome], amount);
    Amount nextVolume = SettlementMath::checkedAdd(totalVolume_, amount);

    positions_.token(outcome).mint(bettor, amount);
    pools_[outcome] = nextPool;
    totalVolume_ = nextVolume;
    participants_.insert(bettor);
}

void PredictionMarket::settle(const SettlementInput& input, Timestamp now) {
    const std::size_t count = outcomeCount();
    std::vector<Amount> supplies(count, 0);
    Amount total = 0;
    Amount pooled = 0;
    for (std::size_t i = 0; i < count; ++i) {
        supplies[i] = positions_.token(i).totalSupply();
        total = SettlementMath::checkedAdd(total, supplies[i]);
        pooled = SettlementMath::checkedAdd(pooled, pools_[i]);
    }
    if (total != pooled) {
        throw InvariantViolation("market " + std::to_string(id_) + " supply does not match its pools");
    }

    SettlementRecord record;
    record.settled = true;
    record.settlementValue = input.settlementValue;
    record.dataHash = input.dataHash;
    record.reportRevision = input.reportRevision;
    record.settledAt = now;
    record.disputeWindowEnd = SettlementMath::checkedAdd(now, params_.disputeWindowSeconds);

    std::size_t winner = 0;
    switch (params_.type) {
    case MarketType::Binary:
        winner = input.outcome ? 0 : 1;
        record.outcome = input.outcome;
        record.voided = supplies[winner] == 0;
        break;
    case MarketType::Bracket:
        if (input.winningBracket >= count) {
            throw ValidationError("bracket " + std::to_string(input.winningBracket) + " does not exist in market " +
                                  std::to_string(id_));
        }
        winner = input.winningBracket;
        record.winningBracket = winner;
        record.voided = supplies[winner] == 0;
        break;
    case MarketType::Scalar:
        record.longWeightBps =
            SettlementMath::scalarLongWeightBps(input.settlementValue, criteria_.rangeMin, criteria_.rangeMax);
        record.voided = total == 0;
        break;
    }

    if (record.voided) {
        // Nobody backed the result: no fee, every outcome redeems at par.
        record.fees = FeeBreakdown{ 0, 0, 0, total };
        record.allocations = supplies;
    } else {
        record.fees = SettlementMath::applyFees(total, params_.feeBps, params_.creatorShareBps);
        if (params_.type == MarketType::Scalar) {
            record.allocations = SettlementMath::allocateScalar(record.fees.distributable, record.longWeightBps,
                                                                supplies[0], supplies[1]);
        } else {
            record.allocations = SettlementMath::allocateWinnerTakesAll(count, winner, record.fees.distributable);
        }
    }

    const std::vector<MarketStatus> path = pathTo(MarketStatus::Settled);

    for (std::size_t i = 0; i < count; ++i) {
        const bool winning = params_.type == MarketType::Scalar ? record.allocations[i] > 0 : i == winner;
        positions_.token(i).markSettled(winning, record.voided, record.allocations[i]);
    }
    for (MarketStatus step : path) {
        transition(step);
    }
    settlement_ = std::move(record);
}

void PredictionMarket::settleMarket(const Identity& caller,
                                    bool outcome,
                                    std::size_t winningBracket,
                                    std::int64_t settlementValue,
                                    const std::string& dataHash,
                                    Timestamp now) {
    requireOracle(caller);
    requireNotPaused();
    requireSettleable(now);

    SettlementInput input;
    input.outcome = outcome;
    input.winningBracket = winningBracket;
    input.settlementValue = settlementValue;
    input.dataHash = dataHash;
    settle(input, now);
}

MarketStatus PredictionMarket::settleFromReport(const Identity& caller, const ReportSnapshot& report, Timestamp now) {
    requireOracle(caller);
    requireNotPaused();
    requireSettleable(now);
    if (report.key != reportKey()) {
        throw ValidationError("report " + report.key.describe() + " does not belong to market " +
                              std::to_string(id_));
    }
    if (!report.finalized) {
        throw StateError("report " + report.key.describe() + " is not finalized");
    }
    if (criteria_.kind == CriteriaKind::Manual) {
        throw ValidationError("market " + std::to_string(id_) + " has manual criteria");
    }

    if (report.disputeActive) {
        if (status_ == MarketStatus::Disputed) {
            throw StateError("market " + std::to_string(id_) + " is waiting on a dispute");
        }
        advanceTo(MarketStatus::Disputed);
        return status_;
    }

    const std::int64_t value = criteria_.observe(report.aggregate);
    SettlementInput input;
    input.settlementValue = value;
    input.dataHash = report.aggregate.sourceHash;
    input.reportRevision = report.revision;
    switch (params_.type) {
    case MarketType::Binary:
        // An upheld ruling already rewrote the aggregate; each market judges
        // it with its own criteria.
        input.outcome = criteria_.evaluateBinary(value);
        break;
    case MarketType::Bracket:
        input.winningBracket = criteria_.bracketFor(value);
        break;
    case MarketType::Scalar:
        break;
    }
    settle(input, now);
    return status_;
}

MarketStatus PredictionMarket::requestResolution(Timestamp now) {
    requireNotPaused();
    if (now < params_.expiry) {
        throw StateError("market " + std::to_string(id_) + " has not expired");
    }
    if (status_ != MarketStatus::Active && status_ != MarketStatus::Expired) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_));
    }
    advanceTo(MarketStatus::Resolving);
    return status_;
}

void PredictionMarket::flagDisputed(const Identity& caller, Timestamp now) {
    requireOracle(caller);
    requireNotPaused();
    if (now < params_.expiry) {
        throw StateError("market " + std::to_string(id_) + " has not expired");
    }
    if (status_ != MarketStatus::Active && status_ != MarketStatus::Expired && status_ != MarketStatus::Resolving) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_));
    }
    advanceTo(MarketStatus::Disputed);
}

void PredictionMarket::cancelMarket(const Identity& caller, Timestamp now) {
    requireOwner(caller);
    if (!canTransition(status_, MarketStatus::Cancelled)) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_));
    }

    SettlementRecord record;
    record.voided = true;
    record.settledAt = now;
    record.disputeWindowEnd = now;
    if (positions_.initialized()) {
        for (std::size_t i = 0; i < outcomeCount(); ++i) {
            record.allocations.push_back(positions_.token(i).totalSupply());
        }
        for (std::size_t i = 0; i < outcomeCount(); ++i) {
            positions_.token(i).markSettled(false, true, record.allocations[i]);
        }
    }
    transition(MarketStatus::Cancelled);
    settlement_ = std::move(record);
}

Amount PredictionMarket::heldBalance() const {
    Amount total = 0;
    for (Amount pool : pools_) {
        total = SettlementMath::checkedAdd(total, pool);
    }
    Amount out = SettlementMath::checkedSub(total, paidOut_);
    if (feesCollected_) {
        out = SettlementMath::checkedSub(out, settlement_.fees.total);
    }
    return SettlementMath::checkedSub(out, dustAmount_);
}

ClaimResult PredictionMarket::claimWinnings(const Identity& bettor, Timestamp now) {
    requireNotPaused();
    requireRedeemable(now);

    ClaimResult result;
    for (std::size_t i = 0; i < positions_.outcomeCount(); ++i) {
        const PositionToken& token = positions_.token(i);
        Amount balance = token.balanceOf(bettor);
        if (balance == 0) {
            continue;
        }
        result.payout = SettlementMath::checkedAdd(result.payout, token.redemptionValue(balance));
        result.burned.emplace_back(i, balance);
    }
    if (result.burned.empty()) {
        throw InsufficientValueError(bettor + " holds no positions in market " + std::to_string(id_));
    }
    if (result.payout > heldBalance()) {
        throw InvariantViolation("market " + std::to_string(id_) + " cannot cover a payout of " +
                                 std::to_string(result.payout));
    }

    for (const auto& [outcome, amount] : result.burned) {
        positions_.token(outcome).burn(bettor, amount);
    }
    paidOut_ += result.payout;
    return result;
}

Amount PredictionMarket::redeemPositions(const Identity& holder, std::size_t outcome, Amount amount, Timestamp now) {
    requireNotPaused();
    requireRedeemable(now);
    PositionToken& token = positions_.token(outcome);
    Amount value = token.redemptionValue(amount);
    if (value > heldBalance()) {
        throw InvariantViolation("market " + std::to_string(id_) + " cannot cover a redemption of " +
                                 std::to_string(value));
    }
    token.burn(holder, amount);
    paidOut_ += value;
    return value;
}

void PredictionMarket::transferPosition(const Identity& from,
                                        const Identity& to,
                                        std::size_t outcome,
                                        Amount amount) {
    requireNotPaused();
    positions_.token(outcome).transfer(from, to, amount);
}

FeeCollection PredictionMarket::collectFees(const Identity& caller, Timestamp now) {
    if (caller != params_.owner && caller != params_.creator) {
        throw AuthorizationError(caller + " cannot collect fees of market " + std::to_string(id_));
    }
    requireNotPaused();
    if (status_ != MarketStatus::Settled) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_) + ", not settled");
    }
    if (now < settlement_.disputeWindowEnd) {
        throw StateError("market " + std::to_string(id_) + " dispute window is open until " +
                         std::to_string(settlement_.disputeWindowEnd));
    }
    if (feesCollected_) {
        throw StateError("market " + std::to_string(id_) + " fees were already collected");
    }
    if (settlement_.fees.total == 0) {
        throw StateError("market " + std::to_string(id_) + " accrued no fees");
    }
    if (settlement_.fees.total > heldBalance()) {
        throw InvariantViolation("market " + std::to_string(id_) + " cannot cover its fees");
    }

    feesCollected_ = true;
    FeeCollection out;
    out.creator = params_.creator;
    out.creatorAmount = settlement_.fees.creator;
    out.platform = params_.owner;
    out.platformAmount = settlement_.fees.platform;
    return out;
}

Amount PredictionMarket::sweepDust(const Identity& caller, Timestamp now) {
    requireOwner(caller);
    requireNotPaused();
    if (status_ != MarketStatus::Settled) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_) + ", not settled");
    }
    if (now < settlement_.disputeWindowEnd) {
        throw StateError("market " + std::to_string(id_) + " dispute window is open until " +
                         std::to_string(settlement_.disputeWindowEnd));
    }
    if (dustSwept_) {
        throw StateError("market " + std::to_string(id_) + " dust was already swept");
    }
    if (positions_.outstandingClaims() != 0) {
        throw StateError("market " + std::to_string(id_) + " still has unredeemed winning positions");
    }
    const Amount reservedFees = feesCollected_ ? 0 : settlement_.fees.total;
    const Amount dust = SettlementMath::checkedSub(heldBalance(), reservedFees);

    dustSwept_ = true;
    dustAmount_ = dust;
    return dust;
}

const LimitOrder& PredictionMarket::placeLimitOrder(const Identity& owner,
                                                    std::uint64_t orderId,
                                                    Side side,
                                                    std::uint32_t price,
                                                    Amount amount,
                                                    Timestamp expiry,
                                                    Timestamp now) {
    requireNotPaused();
    if (status_ != MarketStatus::Active) {
        throw StateError("market " + std::to_string(id_) + " is " + marketStatusName(status_));
    }
    if (now >= params_.expiry) {
        throw StateError("market " + std::to_string(id_) + " stopped taking orders at " +
                         std::to_string(params_.expiry));
    }
    if (params_.type == MarketType::Bracket) {
        throw ValidationError("limit orders need a two-sided market");
    }
    return book_.place(orderId, owner, side, price, amount, expiry, now);
}

Amount PredictionMarket::cancelLimitOrder(const Identity& owner, std::uint64_t orderId, Timestamp now) {
    requireNotPaused();
    return book_.cancel(owner, orderId, now);
}

void PredictionMarket::setPaused(const Identity& caller, bool paused) {
    requireOwner(caller);
    if (paused_ == paused) {
        throw StateError(std::string("market ") + std::to_string(id_) + (paused ? " is already paused" : " is not paused"));
    }
    paused_ = paused;
}

MarketStats PredictionMarket::getStats() const {
    MarketStats out;
    out.status = status_;
    out.paused = paused_;
    out.pools = pools_;
    for (Amount pool : pools_) {
        out.totalPool = SettlementMath::checkedAdd(out.totalPool, pool);
    }
    out.totalVolume = totalVolume_;
    out.participants = participants_.size();
    out.paidOut = paidOut_;
    out.feesCollected = feesCollected_ ? settlement_.fees.total : 0;
    out.dustSwept = dustAmount_;
    out.orderEscrow = book_.escrowHeld();
    return out;
}

Amount PredictionMarket::getRedemptionValue(std::size_t outcome, Amount amount) const {
    return positions_.redemptionValue(outcome, amount);
}

std::vector<PositionInfo> PredictionMarket::getPositionInfo(const Identity& holder) const {
    std::vector<PositionInfo> out;
    if (!positions_.initialized()) {
        return out;
    }
    for (std::size_t i = 0; i < positions_.outcomeCount(); ++i) {
        const PositionToken& token = positions_.token(i);
        PositionInfo info;
        info.outcome = i;
        info.balance = token.balanceOf(holder);
        info.totalSupply = token.totalSupply();
        info.settled = token.settlement().settled;
        info.winning = token.settlement().winning;
        info.redeemable = info.settled ? token.redemptionValue(info.balance) : 0;
        out.push_back(info);
    }
    return out;
}

Amount PredictionMarket::balanceOf(const Identity& holder, std::size_t outcome) const {
    return positions_.token(outcome).balanceOf(holder);
}

} // namespace wx
