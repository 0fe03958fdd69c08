#include "exchange.hpp"

#include "errors.hpp"

#include <sstream>
#include <utility>

namespace wx {

namespace {

const ProtocolConfig& checked(const ProtocolConfig& cfg) {
    validateConfig(cfg);
    return cfg;
}

// Space separated key=value list for audit entries.
class Fields {
public:
    template <typename T>
    Fields& add(const char* key, const T& value) {
        if (!first_) {
            out_ << ' ';
        }
        first_ = false;
        out_ << key << '=' << value;
        return *this;
    }

    Fields& flag(const char* key, bool value) { return add(key, value ? "true" : "false"); }

    std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;
    bool first_ = true;
};

std::string marketRef(std::uint64_t marketId) {
    return "market:" + std::to_string(marketId);
}

std::string disputeRef(std::uint64_t disputeId) {
    return "dispute:" + std::to_string(disputeId);
}

} // namespace

WeatherExchange::WeatherExchange(Identity owner, const ProtocolConfig& cfg)
    : owner_(std::move(owner))
    , cfg_(checked(cfg))
    , resolver_(owner_, kResolverAddress, cfg_)
    , factory_(owner_, kFactoryAddress, cfg_)
    , audit_(deploymentScope(cfg_)) {}

void WeatherExchange::journal(Timestamp now,
                              const Identity& actor,
                              const std::string& action,
                              const std::string& detail) {
    audit_.append(now, actor, action, detail);
}

void WeatherExchange::addReporter(const Identity& caller,
                                  const Identity& reporter,
                                  const std::string& name,
                                  const std::string& sourceType,
                                  Timestamp now) {
    resolver_.addReporter(caller, reporter, name, sourceType, now);
    journal(now, caller, "add-reporter", Fields().add("reporter", reporter).add("source", sourceType).str());
}

void WeatherExchange::removeReporter(const Identity& caller, const Identity& reporter, Timestamp now) {
    resolver_.removeReporter(caller, reporter);
    journal(now, caller, "remove-reporter", Fields().add("reporter", reporter).str());
}

void WeatherExchange::addArbitrator(const Identity& caller,
                                    const Identity& arbitrator,
                                    const std::string& name,
                                    std::uint32_t weight,
                                    Timestamp now) {
    resolver_.addArbitrator(caller, arbitrator, name, weight, now);
    journal(now, caller, "add-arbitrator", Fields().add("arbitrator", arbitrator).add("weight", weight).str());
}

void WeatherExchange::removeArbitrator(const Identity& caller, const Identity& arbitrator, Timestamp now) {
    resolver_.removeArbitrator(caller, arbitrator);
    journal(now, caller, "remove-arbitrator", Fields().add("arbitrator", arbitrator).str());
}

bool WeatherExchange::submitReport(const Identity& reporter,
                                   const ReportKey& key,
                                   const WeatherReading& reading,
                                   Timestamp now) {
    bool finalized = resolver_.submitReport(reporter, key, reading, now);
    journal(now,
            reporter,
            "submit-report",
            Fields()
                .add("key", key.describe())
                .add("temperature", reading.temperature)
                .add("source", reading.sourceHash)
                .flag("finalized", finalized)
                .str());
    return finalized;
}

std::uint64_t WeatherExchange::disputeResolution(const Identity& disputer,
                                                 const ReportKey& key,
                                                 const std::string& evidence,
                                                 Amount stake,
                                                 Timestamp now) {
    const Dispute& dispute = resolver_.disputeResolution(disputer, key, evidence, stake, now);
    const std::uint64_t id = dispute.id;
    journal(now,
            disputer,
            "dispute",
            Fields().add("dispute", id).add("key", key.describe()).add("stake", stake).add("evidence", evidence).str());
    transfers_.record(now, TransferKind::DisputeStake, disputer, stake, disputeRef(id));
    return id;
}

void WeatherExchange::escalateDispute(const Identity& disputer,
                                      std::uint64_t disputeId,
                                      const std::string& additionalEvidence,
                                      Amount stake,
                                      Timestamp now) {
    const Dispute& dispute = resolver_.escalateDispute(disputer, disputeId, additionalEvidence, stake, now);
    journal(now,
            disputer,
            "escalate",
            Fields().add("dispute", disputeId).add("stake", stake).add("total", dispute.stake).str());
    transfers_.record(now, TransferKind::EscalationStake, disputer, stake, disputeRef(disputeId));
}

void WeatherExchange::arbitratorVote(const Identity& arbitrator,
                                     std::uint64_t disputeId,
                                     bool upheld,
                                     const std::string& reason,
                                     Timestamp now) {
    const Dispute& dispute = resolver_.arbitratorVote(arbitrator, disputeId, upheld, reason, now);
    journal(now,
            arbitrator,
            "vote",
            Fields()
                .add("dispute", disputeId)
                .flag("upheld", upheld)
                .add("upheldWeight", dispute.upheldWeight)
                .add("rejectedWeight", dispute.rejectedWeight)
                .str());
}

DisputeSettlement WeatherExchange::resolveDispute(const Identity& arbitrator,
                                                  std::uint64_t disputeId,
                                                  bool upheld,
                                                  bool newOutcome,
                                                  std::int64_t newValue,
                                                  const std::string& reason,
                                                  Timestamp now) {
    DisputeSettlement settlement =
        resolver_.resolveDispute(arbitrator, disputeId, upheld, newOutcome, newValue, reason, now);
    Fields fields;
    fields.add("dispute", disputeId).flag("upheld", upheld).add("recipient", settlement.recipient).add(
        "amount", settlement.amount);
    if (upheld) {
        fields.add("newValue", newValue).flag("newOutcome", newOutcome);
    }
    journal(now, arbitrator, "resolve", fields.str());
    transfers_.record(now,
                      upheld ? TransferKind::DisputeRefund : TransferKind::DisputeForfeit,
                      settlement.recipient,
                      settlement.amount,
                      disputeRef(disputeId));
    return settlement;
}

std::uint64_t WeatherExchange::createMarket(const Identity& creator, MarketRequest request, Timestamp now) {
    if (request.oracle.empty()) {
        request.oracle = resolver_.address();
    }
    const PredictionMarket& market = factory_.createMarket(creator, request, now);
    journal(now,
            creator,
            "create-market",
            Fields()
                .add("market", market.id())
                .add("type", marketTypeName(market.params().type))
                .add("key", market.reportKey().describe())
                .add("expiry", market.params().expiry)
                .add("oracle", market.params().oracle)
                .add("criteria", market.params().criteria)
                .str());
    return market.id();
}

void WeatherExchange::initPositionLedgers(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    PredictionMarket& market = factory_.market(marketId);
    market.initPositionLedgers(caller);
    journal(now, caller, "init-positions", Fields().add("market", marketId).add("outcomes", market.outcomeCount()).str());
}

void WeatherExchange::placeBet(const Identity& bettor,
                               std::uint64_t marketId,
                               Side side,
                               std::size_t bracketIndex,
                               Amount amount,
                               Timestamp now) {
    PredictionMarket& market = factory_.market(marketId);
    market.placeBet(bettor, side, bracketIndex, amount, now);
    Fields fields;
    fields.add("market", marketId);
    if (market.params().type == MarketType::Bracket) {
        fields.add("bracket", bracketIndex);
    } else {
        fields.add("side", sideName(side));
    }
    fields.add("amount", amount);
    journal(now, bettor, "bet", fields.str());
    transfers_.record(now, TransferKind::Bet, bettor, amount, marketRef(marketId));
}

void WeatherExchange::settleMarket(const Identity& caller,
                                   std::uint64_t marketId,
                                   bool outcome,
                                   std::size_t winningBracket,
                                   std::int64_t settlementValue,
                                   const std::string& dataHash,
                                   Timestamp now) {
    PredictionMarket& market = factory_.market(marketId);
    market.settleMarket(caller, outcome, winningBracket, settlementValue, dataHash, now);
    const SettlementRecord& record = market.settlement();
    journal(now,
            caller,
            "settle",
            Fields()
                .add("market", marketId)
                .add("value", record.settlementValue)
                .flag("voided", record.voided)
                .add("fee", record.fees.total)
                .add("windowEnd", record.disputeWindowEnd)
                .str());
}

MarketStatus WeatherExchange::settleFromReport(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    if (caller != resolver_.owner() && caller != resolver_.address()) {
        throw AuthorizationError(caller + " cannot settle markets for the oracle resolver");
    }
    PredictionMarket& market = factory_.market(marketId);
    if (market.params().oracle != resolver_.address()) {
        throw AuthorizationError("market " + std::to_string(marketId) + " is not settled by the oracle resolver");
    }
    const ReportFeed& feed = resolver_;
    auto report = feed.snapshot(market.reportKey());
    if (!report) {
        throw StateError("no report for " + market.reportKey().describe());
    }
    MarketStatus status = market.settleFromReport(resolver_.address(), *report, now);

    Fields fields;
    fields.add("market", marketId).add("key", report->key.describe()).add("status", marketStatusName(status));
    if (status == MarketStatus::Settled) {
        const SettlementRecord& record = market.settlement();
        fields.add("value", record.settlementValue)
            .add("revision", record.reportRevision)
            .flag("voided", record.voided)
            .add("fee", record.fees.total);
    }
    journal(now, caller, "settle-report", fields.str());
    return status;
}

MarketStatus WeatherExchange::requestResolution(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    MarketStatus status = factory_.market(marketId).requestResolution(now);
    journal(now, caller, "request-resolution", Fields().add("market", marketId).str());
    return status;
}

void WeatherExchange::flagDisputed(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    factory_.market(marketId).flagDisputed(caller, now);
    journal(now, caller, "flag-disputed", Fields().add("market", marketId).str());
}

void WeatherExchange::cancelMarket(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    factory_.market(marketId).cancelMarket(caller, now);
    journal(now, caller, "cancel-market", Fields().add("market", marketId).str());
}

ClaimResult WeatherExchange::claimWinnings(const Identity& bettor, std::uint64_t marketId, Timestamp now) {
    PredictionMarket& market = factory_.market(marketId);
    ClaimResult result = market.claimWinnings(bettor, now);
    journal(now, bettor, "claim", Fields().add("market", marketId).add("payout", result.payout).str());
    transfers_.record(now,
                      market.settlement().voided ? TransferKind::Refund : TransferKind::Payout,
                      bettor,
                      result.payout,
                      marketRef(marketId));
    return result;
}

Amount WeatherExchange::redeemPositions(const Identity& holder,
                                        std::uint64_t marketId,
                                        std::size_t outcome,
                                        Amount amount,
                                        Timestamp now) {
    PredictionMarket& market = factory_.market(marketId);
    Amount value = market.redeemPositions(holder, outcome, amount, now);
    journal(now,
            holder,
            "redeem",
            Fields().add("market", marketId).add("outcome", outcome).add("amount", amount).add("value", value).str());
    transfers_.record(now,
                      market.settlement().voided ? TransferKind::Refund : TransferKind::Payout,
                      holder,
                      value,
                      marketRef(marketId));
    return value;
}

void WeatherExchange::transferPosition(const Identity& from,
                                       const Identity& to,
                                       std::uint64_t marketId,
                                       std::size_t outcome,
                                       Amount amount,
                                       Timestamp now) {
    factory_.market(marketId).transferPosition(from, to, outcome, amount);
    journal(now,
            from,
            "transfer",
            Fields().add("market", marketId).add("outcome", outcome).add("to", to).add("amount", amount).str());
}

FeeCollection WeatherExchange::collectFees(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    FeeCollection fees = factory_.market(marketId).collectFees(caller, now);
    journal(now,
            caller,
            "collect-fees",
            Fields()
                .add("market", marketId)
                .add("creator", fees.creatorAmount)
                .add("platform", fees.platformAmount)
                .str());
    transfers_.record(now, TransferKind::CreatorFee, fees.creator, fees.creatorAmount, marketRef(marketId));
    transfers_.record(now, TransferKind::PlatformFee, fees.platform, fees.platformAmount, marketRef(marketId));
    return fees;
}

Amount WeatherExchange::sweepDust(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    Amount dust = factory_.market(marketId).sweepDust(caller, now);
    journal(now, caller, "sweep-dust", Fields().add("market", marketId).add("amount", dust).str());
    transfers_.record(now, TransferKind::DustSweep, resolver_.treasury(), dust, marketRef(marketId));
    return dust;
}

void WeatherExchange::placeLimitOrder(const Identity& owner,
                                      std::uint64_t marketId,
                                      std::uint64_t orderId,
                                      Side side,
                                      std::uint32_t price,
                                      Amount amount,
                                      Timestamp expiry,
                                      Timestamp now) {
    factory_.market(marketId).placeLimitOrder(owner, orderId, side, price, amount, expiry, now);
    journal(now,
            owner,
            "order",
            Fields()
                .add("market", marketId)
                .add("order", orderId)
                .add("side", sideName(side))
                .add("price", price)
                .add("amount", amount)
                .add("expiry", expiry)
                .str());
    transfers_.record(now, TransferKind::OrderEscrow, owner, amount, marketRef(marketId));
}

Amount WeatherExchange::cancelLimitOrder(const Identity& owner,
                                         std::uint64_t marketId,
                                         std::uint64_t orderId,
                                         Timestamp now) {
    PredictionMarket& market = factory_.market(marketId);
    Amount refund = market.cancelLimitOrder(owner, orderId, now);
    auto order = market.getOrder(orderId);
    journal(now,
            owner,
            "cancel-order",
            Fields()
                .add("market", marketId)
                .add("order", orderId)
                .add("status", order ? orderStatusName(order->status) : "unknown")
                .add("refund", refund)
                .str());
    transfers_.record(now, TransferKind::OrderRefund, owner, refund, marketRef(marketId));
    return refund;
}

void WeatherExchange::pauseMarket(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    factory_.market(marketId).setPaused(caller, true);
    journal(now, caller, "pause-market", Fields().add("market", marketId).str());
}

void WeatherExchange::unpauseMarket(const Identity& caller, std::uint64_t marketId, Timestamp now) {
    factory_.market(marketId).setPaused(caller, false);
    journal(now, caller, "unpause-market", Fields().add("market", marketId).str());
}

void WeatherExchange::pauseFactory(const Identity& caller, bool paused, Timestamp now) {
    factory_.pauseFactory(caller, paused);
    journal(now, caller, "pause-factory", Fields().flag("paused", paused).str());
}

std::optional<LimitOrder> WeatherExchange::getOrder(std::uint64_t marketId, std::uint64_t orderId) const {
    const PredictionMarket* market = factory_.find(marketId);
    if (market == nullptr) {
        return std::nullopt;
    }
    return market->getOrder(orderId);
}

OrderBookSnapshot WeatherExchange::getOrderBook(std::uint64_t marketId) const {
    return factory_.market(marketId).getOrderBook();
}

MarketStats WeatherExchange::getStats(std::uint64_t marketId) const {
    return factory_.market(marketId).getStats();
}

Amount WeatherExchange::getRedemptionValue(std::uint64_t marketId, std::size_t outcome, Amount amount) const {
    return factory_.market(marketId).getRedemptionValue(outcome, amount);
}

std::vector<PositionInfo> WeatherExchange::getPositionInfo(std::uint64_t marketId, const Identity& holder) const {
    return factory_.market(marketId).getPositionInfo(holder);
}

Amount WeatherExchange::balanceOf(std::uint64_t marketId, const Identity& holder, std::size_t outcome) const {
    return factory_.market(marketId).balanceOf(holder, outcome);
}

} // namespace wx
