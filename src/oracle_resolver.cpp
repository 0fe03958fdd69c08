#include "oracle_resolver.hpp"

#include "errors.hpp"

#include <stdexcept>
#include <utility>

namespace wx {

OracleResolver::OracleResolver(Identity owner, Identity address, const ProtocolConfig& cfg)
    : owner_(std::move(owner))
    , address_(std::move(address))
    , aggregator_(cfg.temperatureTolerance, cfg.minReportsForConsensus)
    , disputes_(cfg.disputeStake, cfg.escalationStake) {
    if (owner_.empty() || address_.empty()) {
        throw std::invalid_argument("oracle resolver needs an owner and an address");
    }
}

void OracleResolver::requireOwner(const Identity& caller) const {
    if (caller != owner_) {
        throw AuthorizationError(caller + " is not the oracle owner");
    }
}

void OracleResolver::addReporter(const Identity& caller,
                                 const Identity& reporter,
                                 const std::string& name,
                                 const std::string& sourceType,
                                 Timestamp now) {
    requireOwner(caller);
    ReporterRecord record;
    record.name = name;
    record.sourceType = sourceType;
    record.registeredAt = now;
    reporters_.add(reporter, std::move(record));
}

void OracleResolver::removeReporter(const Identity& caller, const Identity& reporter) {
    requireOwner(caller);
    reporters_.remove(reporter);
}

void OracleResolver::addArbitrator(const Identity& caller,
                                   const Identity& arbitrator,
                                   const std::string& name,
                                   std::uint32_t weight,
                                   Timestamp now) {
    requireOwner(caller);
    if (weight == 0) {
        throw ValidationError("arbitrator weight must be positive");
    }
    ArbitratorRecord record;
    record.name = name;
    record.weight = weight;
    record.registeredAt = now;
    arbitrators_.add(arbitrator, std::move(record));
}

void OracleResolver::removeArbitrator(const Identity& caller, const Identity& arbitrator) {
    requireOwner(caller);
    arbitrators_.remove(arbitrator);
}

bool OracleResolver::submitReport(const Identity& reporter,
                                  const ReportKey& key,
                                  const WeatherReading& reading,
                                  Timestamp now) {
    ReporterRecord& record = reporters_.requireActive(reporter);
    if (disputes_.hasActive(key)) {
        throw StateError("report " + key.describe() + " is under dispute");
    }
    bool finalized = aggregator_.submit(reporter, key, reading, now, [this](const Identity& id) {
        return reporters_.isActive(id);
    });
    record.submissions++;
    return finalized;
}

const Dispute& OracleResolver::disputeResolution(const Identity& disputer,
                                                 const ReportKey& key,
                                                 const std::string& evidence,
                                                 Amount stake,
                                                 Timestamp now) {
    if (!aggregator_.isFinalized(key)) {
        throw StateError("report " + key.describe() + " is not finalized");
    }
    return disputes_.open(disputer, key, evidence, stake, now);
}

const Dispute& OracleResolver::escalateDispute(const Identity& disputer,
                                               std::uint64_t disputeId,
                                               const std::string& additionalEvidence,
                                               Amount stake,
                                               Timestamp now) {
    return disputes_.escalate(disputer, disputeId, additionalEvidence, stake, now);
}

const Dispute& OracleResolver::arbitratorVote(const Identity& arbitrator,
                                              std::uint64_t disputeId,
                                              bool upheld,
                                              const std::string& reason,
                                              Timestamp now) {
    const ArbitratorRecord& record = arbitrators_.requireActive(arbitrator);
    return disputes_.recordVote(arbitrator, record.weight, disputeId, upheld, reason, now);
}

DisputeSettlement OracleResolver::resolveDispute(const Identity& arbitrator,
                                                 std::uint64_t disputeId,
                                                 bool upheld,
                                                 bool newOutcome,
                                                 std::int64_t newValue,
                                                 const std::string& reason,
                                                 Timestamp now) {
    ArbitratorRecord& record = arbitrators_.requireActive(arbitrator);
    disputes_.checkResolvable(disputeId);
    const Dispute* dispute = disputes_.find(disputeId);
    if (dispute == nullptr || !aggregator_.isFinalized(dispute->key)) {
        throw InvariantViolation("disputed report is not finalized");
    }

    DisputeSettlement settlement =
        disputes_.resolve(arbitrator, disputeId, upheld, newValue, newOutcome, reason, treasury(), now);
    if (upheld) {
        aggregator_.applyCorrection(settlement.key, newValue, newOutcome);
    }
    record.disputesResolved++;
    return settlement;
}

std::optional<ReportSnapshot> OracleResolver::snapshot(const ReportKey& key) const {
    const WeatherReport* report = aggregator_.find(key);
    if (report == nullptr) {
        return std::nullopt;
    }
    ReportSnapshot out;
    out.key = key;
    out.finalized = report->finalized;
    out.disputeActive = disputes_.hasActive(key);
    out.aggregate = report->aggregate;
    out.revision = report->revision;
    return out;
}

} // namespace wx
