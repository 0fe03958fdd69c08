#pragma once

#include "ledger_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wx {

enum class DisputeStatus : std::uint8_t {
    Open = 0,
    Escalated = 1,
    ResolvedUpheld = 2,
    ResolvedRejected = 3
};

const char* disputeStatusName(DisputeStatus status);

struct ArbitratorVote {
    Identity arbitrator;
    std::uint32_t weight = 0;
    bool upheld = false;
    std::string reason;
    Timestamp castAt = 0;
};

struct Dispute {
    std::uint64_t id = 0;
    ReportKey key;
    Identity disputer;
    Amount stake = 0;
    std::string evidence;
    std::string additionalEvidence;
    DisputeStatus status = DisputeStatus::Open;
    std::vector<ArbitratorVote> votes;
    std::uint64_t upheldWeight = 0;
    std::uint64_t rejectedWeight = 0;
    Timestamp createdAt = 0;
    Timestamp escalatedAt = 0;
    Timestamp resolvedAt = 0;
    Identity resolvedBy;
    std::string ruling;
    std::optional<std::int64_t> correctedValue;
    std::optional<bool> correctedOutcome;

    bool isActive() const {
        return status == DisputeStatus::Open || status == DisputeStatus::Escalated;
    }
    bool hasVoted(const Identity& arbitrator) const;
};

// Stake movement produced by a ruling. Upheld returns the stake to the
// disputer; rejected forfeits it to the treasury.
struct DisputeSettlement {
    std::uint64_t disputeId = 0;
    ReportKey key;
    Identity recipient;
    Amount amount = 0;
    bool upheld = false;
};

class DisputeLedger {
public:
    DisputeLedger(Amount disputeStake, Amount escalationStake);

    const Dispute& open(const Identity& disputer,
                        const ReportKey& key,
                        const std::string& evidence,
                        Amount stake,
                        Timestamp now);

    const Dispute& escalate(const Identity& caller,
                            std::uint64_t disputeId,
                            const std::string& additionalEvidence,
                            Amount stake,
                            Timestamp now);

    // Caller must already be an active arbitrator; weight comes from its record.
    const Dispute& recordVote(const Identity& arbitrator,
                              std::uint32_t weight,
                              std::uint64_t disputeId,
                              bool upheld,
                              const std::string& reason,
                              Timestamp now);

    // Throws without mutating when the dispute cannot be resolved.
    void checkResolvable(std::uint64_t disputeId) const;

    DisputeSettlement resolve(const Identity& arbitrator,
                              std::uint64_t disputeId,
                              bool upheld,
                              std::int64_t newValue,
                              bool newOutcome,
                              const std::string& reason,
                              const Identity& treasury,
                              Timestamp now);

    const Dispute* find(std::uint64_t disputeId) const;
    const Dispute* findActive(const ReportKey& key) const;
    // Most recent dispute for the key, active or not.
    const Dispute* findLatest(const ReportKey& key) const;
    bool hasActive(const ReportKey& key) const { return findActive(key) != nullptr; }

    Amount disputeStake() const { return disputeStake_; }
    Amount escalationStake() const { return escalationStake_; }
    Amount escrowed() const { return escrowed_; }
    Amount refunded() const { return refunded_; }
    Amount forfeited() const { return forfeited_; }
    std::uint64_t nextId() const { return nextId_; }

private:
    Dispute& require(std::uint64_t disputeId);
    const Dispute& require(std::uint64_t disputeId) const;
    static void transition(Dispute& dispute, DisputeStatus next);

    Amount disputeStake_;
    Amount escalationStake_;
    Amount escrowed_ = 0;
    Amount refunded_ = 0;
    Amount forfeited_ = 0;
    std::uint64_t nextId_ = 0;
    std::map<std::uint64_t, Dispute> disputes_;
    std::unordered_map<ReportKey, std::uint64_t, ReportKeyHash> activeByKey_;
    std::unordered_map<ReportKey, std::uint64_t, ReportKeyHash> latestByKey_;
};

} // namespace wx
