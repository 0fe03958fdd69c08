#pragma once

#include "audit_journal.hpp"
#include "ledger_types.hpp"
#include "market.hpp"
#include "market_factory.hpp"
#include "oracle_resolver.hpp"
#include "protocol_config.hpp"
#include "transfer_journal.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wx {

// Single-writer request processor. Each entry point either throws with no
// state change or applies the transition, then appends one audit entry and
// the value movements it caused.
class WeatherExchange {
public:
    static constexpr const char* kResolverAddress = "oracle-resolver";
    static constexpr const char* kFactoryAddress = "market-factory";

    WeatherExchange(Identity owner, const ProtocolConfig& cfg);

    // Registries
    void addReporter(const Identity& caller,
                     const Identity& reporter,
                     const std::string& name,
                     const std::string& sourceType,
                     Timestamp now);
    void removeReporter(const Identity& caller, const Identity& reporter, Timestamp now);
    void addArbitrator(const Identity& caller,
                       const Identity& arbitrator,
                       const std::string& name,
                       std::uint32_t weight,
                       Timestamp now);
    void removeArbitrator(const Identity& caller, const Identity& arbitrator, Timestamp now);

    // Oracle
    bool submitReport(const Identity& reporter, const ReportKey& key, const WeatherReading& reading, Timestamp now);
    std::uint64_t disputeResolution(const Identity& disputer,
                                    const ReportKey& key,
                                    const std::string& evidence,
                                    Amount stake,
                                    Timestamp now);
    void escalateDispute(const Identity& disputer,
                         std::uint64_t disputeId,
                         const std::string& additionalEvidence,
                         Amount stake,
                         Timestamp now);
    void arbitratorVote(const Identity& arbitrator,
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

    // Markets
    std::uint64_t createMarket(const Identity& creator, MarketRequest request, Timestamp now);
    void initPositionLedgers(const Identity& caller, std::uint64_t marketId, Timestamp now);
    void placeBet(const Identity& bettor,
                  std::uint64_t marketId,
                  Side side,
                  std::size_t bracketIndex,
                  Amount amount,
                  Timestamp now);
    void settleMarket(const Identity& caller,
                      std::uint64_t marketId,
                      bool outcome,
                      std::size_t winningBracket,
                      std::int64_t settlementValue,
                      const std::string& dataHash,
                      Timestamp now);
    // Settles a resolver-backed market from the current report state. Only
    // the resolver's owner or the resolver itself may trigger it.
    MarketStatus settleFromReport(const Identity& caller, std::uint64_t marketId, Timestamp now);
    MarketStatus requestResolution(const Identity& caller, std::uint64_t marketId, Timestamp now);
    void flagDisputed(const Identity& caller, std::uint64_t marketId, Timestamp now);
    void cancelMarket(const Identity& caller, std::uint64_t marketId, Timestamp now);
    ClaimResult claimWinnings(const Identity& bettor, std::uint64_t marketId, Timestamp now);
    Amount redeemPositions(const Identity& holder,
                           std::uint64_t marketId,
                           std::size_t outcome,
                           Amount amount,
                           Timestamp now);
    void transferPosition(const Identity& from,
                          const Identity& to,
                          std::uint64_t marketId,
                          std::size_t outcome,
                          Amount amount,
                          Timestamp now);
    FeeCollection collectFees(const Identity& caller, std::uint64_t marketId, Timestamp now);
    Amount sweepDust(const Identity& caller, std::uint64_t marketId, Timestamp now);
    void placeLimitOrder(const Identity& owner,
                         std::uint64_t marketId,
                         std::uint64_t orderId,
                         Side side,
                         std::uint32_t price,
                         Amount amount,
                         Timestamp expiry,
                         Timestamp now);
    Amount cancelLimitOrder(const Identity& owner, std::uint64_t marketId, std::uint64_t orderId, Timestamp now);
    void pauseMarket(const Identity& caller, std::uint64_t marketId, Timestamp now);
    void unpauseMarket(const Identity& caller, std::uint64_t marketId, Timestamp now);
    void pauseFactory(const Identity& caller, bool paused, Timestamp now);

    // Queries
    bool isFinalized(const ReportKey& key) const { return resolver_.isFinalized(key); }
    const WeatherReport* getReport(const ReportKey& key) const { return resolver_.getReport(key); }
    const Dispute* getDispute(std::uint64_t disputeId) const { return resolver_.getDispute(disputeId); }
    const Dispute* getDisputeByReport(const ReportKey& key) const { return resolver_.getDisputeByReport(key); }
    bool hasActiveDispute(const ReportKey& key) const { return resolver_.hasActiveDispute(key); }
    Amount getDisputeStake() const { return resolver_.getDisputeStake(); }
    Amount getEscalationStake() const { return resolver_.getEscalationStake(); }
    const ArbitratorRecord* getArbitrator(const Identity& id) const { return resolver_.getArbitrator(id); }
    bool isArbitrator(const Identity& id) const { return resolver_.isArbitrator(id); }
    const ReporterRecord* getReporter(const Identity& id) const { return resolver_.getReporter(id); }
    std::optional<LimitOrder> getOrder(std::uint64_t marketId, std::uint64_t orderId) const;
    OrderBookSnapshot getOrderBook(std::uint64_t marketId) const;
    MarketStats getStats(std::uint64_t marketId) const;
    Amount getRedemptionValue(std::uint64_t marketId, std::size_t outcome, Amount amount) const;
    std::vector<PositionInfo> getPositionInfo(std::uint64_t marketId, const Identity& holder) const;
    Amount balanceOf(std::uint64_t marketId, const Identity& holder, std::size_t outcome) const;
    std::string journalRoot() const { return audit_.merkleRoot(); }

    const PredictionMarket& market(std::uint64_t marketId) const { return factory_.market(marketId); }
    const OracleResolver& resolver() const { return resolver_; }
    const MarketFactory& factory() const { return factory_; }
    const AuditJournal& audit() const { return audit_; }
    const TransferJournal& transfers() const { return transfers_; }
    const ProtocolConfig& config() const { return cfg_; }
    const Identity& owner() const { return owner_; }

private:
    void journal(Timestamp now, const Identity& actor, const std::string& action, const std::string& detail);

    Identity owner_;
    ProtocolConfig cfg_;
    OracleResolver resolver_;
    MarketFactory factory_;
    AuditJournal audit_;
    TransferJournal transfers_;
};

} // namespace wx
