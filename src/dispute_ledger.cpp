#include "dispute_ledger.hpp"

#include "errors.hpp"
#include "settlement_math.hpp"

#include <algorithm>
#include <stdexcept>

namespace wx {

const char* disputeStatusName(DisputeStatus status) {
    switch (status) {
    case DisputeStatus::Open:
        return "open";
    case DisputeStatus::Escalated:
        return "escalated";
    case DisputeStatus::ResolvedUpheld:
        return "upheld";
    case DisputeStatus::ResolvedRejected:
        return "rejected";
    }
    return "unknown";
}

bool Dispute::hasVoted(const Identity& arbitrator) const {
    return std::any_of(votes.begin(), votes.end(), [&](const ArbitratorVote& vote) {
        return vote.arbitrator == arbitrator;
    });
}

DisputeLedger::DisputeLedger(Amount disputeStake, Amount escalationStake)
    : disputeStake_(disputeStake)
    , escalationStake_(escalationStake) {
    if (disputeStake_ == 0 || escalationStake_ == 0) {
        throw std::invalid_argument("dispute stakes must be positive");
    }
}

void DisputeLedger::transition(Dispute& dispute, DisputeStatus next) {
    bool allowed = false;
    switch (dispute.status) {
    case DisputeStatus::Open:
        allowed = next == DisputeStatus::Escalated;
        break;
    case DisputeStatus::Escalated:
        allowed = next == DisputeStatus::ResolvedUpheld || next == DisputeStatus::ResolvedRejected;
        break;
    case DisputeStatus::ResolvedUpheld:
    case DisputeStatus::ResolvedRejected:
        break;
    }
    if (!allowed) {
        throw StateError("dispute " + std::to_string(dispute.id) + " cannot move from " +
                         disputeStatusName(dispute.status) + " to " + disputeStatusName(next));
    }
    dispute.status = next;
}

Dispute& DisputeLedger::require(std::uint64_t disputeId) {
    auto it = disputes_.find(disputeId);
    if (it == disputes_.end()) {
        throw ValidationError("unknown dispute " + std::to_string(disputeId));
    }
    return it->second;
}

const Dispute& DisputeLedger::require(std::uint64_t disputeId) const {
    auto it = disputes_.find(disputeId);
    if (it == disputes_.end()) {
        throw ValidationError("unknown dispute " + std::to_string(disputeId));
    }
    return it->second;
}

const Dispute& DisputeLedger::open(const Identity& disputer,
                                   const ReportKey& key,
                                   const std::string& evidence,
                                   Amount stake,
                                   Timestamp now) {
    if (hasActive(key)) {
        throw ValidationError("report " + key.describe() + " already has an active dispute");
    }
    if (stake < disputeStake_) {
        throw InsufficientValueError("dispute stake " + std::to_string(stake) + " is below the minimum " +
                                     std::to_string(disputeStake_));
    }
    if (evidence.empty()) {
        throw ValidationError("dispute evidence must not be empty");
    }
    Amount nextEscrow = SettlementMath::checkedAdd(escrowed_, stake);

    Dispute dispute;
    dispute.id = nextId_;
    dispute.key = key;
    dispute.disputer = disputer;
    dispute.stake = stake;
    dispute.evidence = evidence;
    dispute.createdAt = now;

    auto [it, inserted] = disputes_.emplace(dispute.id, std::move(dispute));
    if (!inserted) {
        throw InvariantViolation("dispute id reused");
    }
    escrowed_ = nextEscrow;
    activeByKey_[key] = it->first;
    latestByKey_[key] = it->first;
    ++nextId_;
    return it->second;
}

const Dispute& DisputeLedger::escalate(const Identity& caller,
                                       std::uint64_t disputeId,
                                       const std::string& additionalEvidence,
                                       Amount stake,
                                       Timestamp now) {
    Dispute& dispute = require(disputeId);
    if (dispute.disputer != caller) {
        throw AuthorizationError("only the original disputer may escalate dispute " + std::to_string(disputeId));
    }
    if (dispute.status != DisputeStatus::Open) {
        throw StateError("dispute " + std::to_string(disputeId) + " is " + disputeStatusName(dispute.status) +
                         ", only open disputes escalate");
    }
    if (stake < escalationStake_) {
        throw InsufficientValueError("escalation stake " + std::to_string(stake) + " is below the minimum " +
                                     std::to_string(escalationStake_));
    }
    Amount nextStake = SettlementMath::checkedAdd(dispute.stake, stake);
    Amount nextEscrow = SettlementMath::checkedAdd(escrowed_, stake);

    transition(dispute, DisputeStatus::Escalated);
    dispute.stake = nextStake;
    dispute.additionalEvidence = additionalEvidence;
    dispute.escalatedAt = now;
    escrowed_ = nextEscrow;
    return dispute;
}

const Dispute& DisputeLedger::recordVote(const Identity& arbitrator,
                                         std::uint32_t weight,
                                         std::uint64_t disputeId,
                                         bool upheld,
                                         const std::string& reason,
                                         Timestamp now) {
    Dispute& dispute = require(disputeId);
    if (!dispute.isActive()) {
        throw StateError("dispute " + std::to_string(disputeId) + " is already resolved");
    }
    if (dispute.hasVoted(arbitrator)) {
        throw ValidationError(arbitrator + " already voted on dispute " + std::to_string(disputeId));
    }
    if (weight == 0) {
        throw InvariantViolation("arbitrator weight must be positive");
    }

    dispute.votes.push_back(ArbitratorVote{ arbitrator, weight, upheld, reason, now });
    if (upheld) {
        dispute.upheldWeight += weight;
    } else {
        dispute.rejectedWeight += weight;
    }
    return dispute;
}

void DisputeLedger::checkResolvable(std::uint64_t disputeId) const {
    const Dispute& dispute = require(disputeId);
    if (dispute.status == DisputeStatus::Open) {
        throw StateError("dispute " + std::to_string(disputeId) + " must be escalated before resolution");
    }
    if (dispute.status != DisputeStatus::Escalated) {
        throw StateError("dispute " + std::to_string(disputeId) + " is already resolved");
    }
    if (dispute.votes.empty()) {
        throw StateError("dispute " + std::to_string(disputeId) + " has no arbitrator votes");
    }
    if (dispute.stake > escrowed_) {
        throw InvariantViolation("dispute escrow does not cover the stake");
    }
}

DisputeSettlement DisputeLedger::resolve(const Identity& arbitrator,
                                         std::uint64_t disputeId,
                                         bool upheld,
                                         std::int64_t newValue,
                                         bool newOutcome,
                                         const std::string& reason,
                                         const Identity& treasury,
                                         Timestamp now) {
    checkResolvable(disputeId);
    Dispute& dispute = require(disputeId);
    Amount nextRefunded = upheld ? SettlementMath::checkedAdd(refunded_, dispute.stake) : refunded_;
    Amount nextForfeited = upheld ? forfeited_ : SettlementMath::checkedAdd(forfeited_, dispute.stake);

    transition(dispute, upheld ? DisputeStatus::ResolvedUpheld : DisputeStatus::ResolvedRejected);
    dispute.resolvedAt = now;
    dispute.resolvedBy = arbitrator;
    dispute.ruling = reason;
    if (upheld) {
        dispute.correctedValue = newValue;
        dispute.correctedOutcome = newOutcome;
    }

    DisputeSettlement settlement;
    settlement.disputeId = dispute.id;
    settlement.key = dispute.key;
    settlement.upheld = upheld;
    settlement.amount = dispute.stake;
    settlement.recipient = upheld ? dispute.disputer : treasury;

    escrowed_ -= dispute.stake;
    refunded_ = nextRefunded;
    forfeited_ = nextForfeited;
    activeByKey_.erase(dispute.key);
    return settlement;
}

const Dispute* DisputeLedger::find(std::uint64_t disputeId) const {
    auto it = disputes_.find(disputeId);
    return it == disputes_.end() ? nullptr : &it->second;
}

const Dispute* DisputeLedger::findActive(const ReportKey& key) const {
    auto it = activeByKey_.find(key);
    if (it == activeByKey_.end()) {
        return nullptr;
    }
    return find(it->second);
}

const Dispute* DisputeLedger::findLatest(const ReportKey& key) const {
    auto it = latestByKey_.find(key);
    if (it == latestByKey_.end()) {
        return nullptr;
    }
    return find(it->second);
}

} // namespace wx
