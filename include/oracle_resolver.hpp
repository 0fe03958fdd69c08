#pragma once

#include "aggregator.hpp"
#include "dispute_ledger.hpp"
#include "ledger_types.hpp"
#include "protocol_config.hpp"
#include "registry.hpp"
#include "weather_report.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace wx {

struct ReporterRecord {
    std::string name;
    std::string sourceType;
    bool active = false;
    std::uint64_t submissions = 0;
    Timestamp registeredAt = 0;

    void reactivate(const ReporterRecord& fresh) {
        name = fresh.name;
        sourceType = fresh.sourceType;
        registeredAt = fresh.registeredAt;
    }
};

struct ArbitratorRecord {
    std::string name;
    std::uint32_t weight = 0;
    bool active = false;
    std::uint64_t disputesResolved = 0;
    Timestamp registeredAt = 0;

    void reactivate(const ArbitratorRecord& fresh) {
        name = fresh.name;
        weight = fresh.weight;
        registeredAt = fresh.registeredAt;
    }
};

// Read side the markets settle against.
class ReportFeed {
public:
    virtual ~ReportFeed() = default;
    virtual std::optional<ReportSnapshot> snapshot(const ReportKey& key) const = 0;
};

class OracleResolver : public ReportFeed {
public:
    OracleResolver(Identity owner, Identity address, const ProtocolConfig& cfg);

    void addReporter(const Identity& caller,
                     const Identity& reporter,
                     const std::string& name,
                     const std::string& sourceType,
                     Timestamp now);
    void removeReporter(const Identity& caller, const Identity& reporter);
    void addArbitrator(const Identity& caller,
                       const Identity& arbitrator,
                       const std::string& name,
                       std::uint32_t weight,
                       Timestamp now);
    void removeArbitrator(const Identity& caller, const Identity& arbitrator);

    // Returns true when this submission finalized the report.
    bool submitReport(const Identity& reporter, const ReportKey& key, const WeatherReading& reading, Timestamp now);

    const Dispute& disputeResolution(const Identity& disputer,
                                     const ReportKey& key,
                                     const std::string& evidence,
                                     Amount stake,
                                     Timestamp now);
    const Dispute& escalateDispute(const Identity& disputer,
                                   std::uint64_t disputeId,
                                   const std::string& additionalEvidence,
                                   Amount stake,
                                   Timestamp now);
    const Dispute& arbitratorVote(const Identity& arbitrator,
                                  std::uint64_t disputeId,
                                  bool upheld,
                                  const std::string& reason,
                                  Timestamp now);
    DisputeSettlement resolveDispute(const Identity& arbitrator,
                                     std::uint64_t disputeId,
                                     bool upheld,
                                     bool newOutcome,
                                     std::int64_t newValue,
                                     const std::string& reason,
                                     Timestamp now);

    bool isFinalized(const ReportKey& key) const { return aggregator_.isFinalized(key); }
    const WeatherReport* getReport(const ReportKey& key) const { return aggregator_.find(key); }
    const Dispute* getDispute(std::uint64_t disputeId) const { return disputes_.find(disputeId); }
    const Dispute* getDisputeByReport(const ReportKey& key) const { return disputes_.findLatest(key); }
    bool hasActiveDispute(const ReportKey& key) const { return disputes_.hasActive(key); }
    Amount getDisputeStake() const { return disputes_.disputeStake(); }
    Amount getEscalationStake() const { return disputes_.escalationStake(); }
    const ArbitratorRecord* getArbitrator(const Identity& id) const { return arbitrators_.lookup(id); }
    bool isArbitrator(const Identity& id) const { return arbitrators_.isActive(id); }
    const ReporterRecord* getReporter(const Identity& id) const { return reporters_.lookup(id); }
    bool isReporter(const Identity& id) const { return reporters_.isActive(id); }

    std::optional<ReportSnapshot> snapshot(const ReportKey& key) const override;

    const Identity& owner() const { return owner_; }
    const Identity& address() const { return address_; }
    // Forfeited stakes go to the owner.
    const Identity& treasury() const { return owner_; }
    const DisputeLedger& disputes() const { return disputes_; }

private:
    void requireOwner(const Identity& caller) const;

    Identity owner_;
    Identity address_;
    Registry<ReporterRecord> reporters_{ "reporter" };
    Registry<ArbitratorRecord> arbitrators_{ "arbitrator" };
    WeatherAggregator aggregator_;
    DisputeLedger disputes_;
};

} // namespace wx
