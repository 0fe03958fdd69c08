#include "errors.hpp"
#include "market.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "market_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Error, typename Fn>
void expectThrows(Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const Error&) {
        return;
    } catch (const std::exception& ex) {
        fail(what + " threw the wrong error: " + ex.what());
    }
    fail(what + " did not throw");
}

constexpr wx::Timestamp kExpiry = 1'000;
constexpr wx::Timestamp kWindow = 3'600;

wx::MarketParams params(wx::MarketType type, const std::string& criteria) {
    wx::MarketParams out;
    out.description = "test market";
    out.locationId = 1001;
    out.dateKey = 19'675;
    out.expiry = kExpiry;
    out.oracle = "oracle";
    out.type = type;
    out.criteria = criteria;
    out.creator = "creator";
    out.owner = "owner";
    out.factory = "factory";
    out.disputeWindowSeconds = kWindow;
    return out;
}

void checkConservation(const wx::PredictionMarket& market, const std::string& label) {
    wx::MarketStats stats = market.getStats();
    if (stats.totalPool != stats.paidOut + stats.feesCollected + stats.dustSwept) {
        fail(label + ": pool != payouts + fees + dust");
    }
}

void binaryEvenSplit() {
    using namespace wx;
    PredictionMarket market(1, params(MarketType::Binary, "binary:temp:gt:250"));

    expectThrows<StateError>([&] { market.placeBet("alice", Side::Yes, 0, kUnit, 100); }, "bet before setup");
    expectThrows<AuthorizationError>([&] { market.initPositionLedgers("mallory"); }, "setup by a stranger");
    market.initPositionLedgers("factory");
    if (market.status() != MarketStatus::Active) {
        fail("setup should activate the market");
    }
    expectThrows<StateError>([&] { market.initPositionLedgers("owner"); }, "second setup");

    expectThrows<InsufficientValueError>([&] { market.placeBet("alice", Side::Yes, 0, kUnit / 10 - 1, 100); },
                                         "bet below the minimum");
    market.placeBet("alice", Side::Yes, 0, 10 * kUnit, 100);
    market.placeBet("bob", Side::No, 0, 10 * kUnit, 100);
    expectThrows<StateError>([&] { market.placeBet("carol", Side::Yes, 0, kUnit, kExpiry); }, "bet at expiry");

    MarketStats stats = market.getStats();
    if (stats.totalPool != 20 * kUnit || stats.participants != 2 || stats.pools[0] != 10 * kUnit) {
        fail("pools not credited");
    }
    if (market.balanceOf("alice", 0) != 10 * kUnit) {
        fail("bets should mint positions 1:1");
    }

    expectThrows<StateError>([&] { market.settleMarket("oracle", true, 0, 0, "h", kExpiry - 1); },
                             "settlement before expiry");
    expectThrows<AuthorizationError>([&] { market.settleMarket("alice", true, 0, 0, "h", kExpiry); },
                                     "settlement by a non-oracle");
    market.settleMarket("oracle", true, 0, 0, "h", kExpiry);
    const SettlementRecord& record = market.settlement();
    if (market.status() != MarketStatus::Settled || !record.outcome || !*record.outcome || record.voided) {
        fail("market should settle YES");
    }
    if (record.fees.total != 300'000'000 || record.fees.creator != 120'000'000 ||
        record.allocations[0] != 19'700'000'000ULL || record.disputeWindowEnd != kExpiry + kWindow) {
        fail("settlement fees or allocation wrong");
    }
    expectThrows<StateError>([&] { market.settleMarket("oracle", false, 0, 0, "h", kExpiry + 1); },
                             "second settlement");

    expectThrows<StateError>([&] { market.claimWinnings("alice", kExpiry + kWindow - 1); },
                             "claim inside the dispute window");
    expectThrows<StateError>([&] { market.collectFees("owner", kExpiry + kWindow - 1); },
                             "fees inside the dispute window");

    const Timestamp after = kExpiry + kWindow;
    ClaimResult alice = market.claimWinnings("alice", after);
    if (alice.payout != 19'700'000'000ULL) {
        fail("YES claim should pay 20 x (1 - 1.5%)");
    }
    if (market.claimWinnings("bob", after).payout != 0) {
        fail("losing claim should pay zero");
    }
    expectThrows<InsufficientValueError>([&] { market.claimWinnings("bob", after); }, "claim with no balance");

    expectThrows<AuthorizationError>([&] { market.collectFees("bob", after); }, "fee collection by a bettor");
    FeeCollection fees = market.collectFees("creator", after);
    if (fees.creator != "creator" || fees.creatorAmount != 120'000'000 || fees.platform != "owner" ||
        fees.platformAmount != 180'000'000) {
        fail("fee collection split wrong");
    }
    expectThrows<StateError>([&] { market.collectFees("owner", after); }, "collecting fees twice");
    if (market.sweepDust("owner", after) != 0) {
        fail("even split leaves no dust");
    }
    checkConservation(market, "even split");
}

void dustAndSweep() {
    using namespace wx;
    PredictionMarket market(2, params(MarketType::Binary, "manual"));
    market.initPositionLedgers("owner");
    market.placeBet("a", Side::Yes, 0, kUnit, 10);
    market.placeBet("b", Side::Yes, 0, kUnit, 10);
    market.placeBet("c", Side::Yes, 0, kUnit, 10);
    market.placeBet("d", Side::No, 0, kUnit, 10);
    market.settleMarket("oracle", true, 0, 0, "h", kExpiry);

    const Timestamp after = kExpiry + kWindow;
    if (market.getRedemptionValue(0, kUnit) != 1'313'333'333) {
        fail("per-claim redemption should floor");
    }
    market.claimWinnings("a", after);
    expectThrows<StateError>([&] { market.sweepDust("owner", after); }, "sweep with outstanding claims");
    market.claimWinnings("b", after);
    market.claimWinnings("c", after);
    expectThrows<AuthorizationError>([&] { market.sweepDust("creator", after); }, "sweep by a non-owner");
    if (market.sweepDust("owner", after) != 1) {
        fail("floor remainder should be one base unit");
    }
    expectThrows<StateError>([&] { market.sweepDust("owner", after); }, "sweeping twice");
    market.collectFees("owner", after);
    checkConservation(market, "dust");
}

void voidedSettlement() {
    using namespace wx;
    PredictionMarket market(3, params(MarketType::Binary, "manual"));
    market.initPositionLedgers("owner");
    market.placeBet("alice", Side::Yes, 0, 5 * kUnit, 10);
    market.settleMarket("oracle", false, 0, 0, "h", kExpiry);
    if (!market.settlement().voided || market.settlement().fees.total != 0) {
        fail("unbacked winner should void without a fee");
    }
    if (market.claimWinnings("alice", kExpiry + kWindow).payout != 5 * kUnit) {
        fail("voided market refunds at par");
    }
    expectThrows<StateError>([&] { market.collectFees("owner", kExpiry + kWindow); }, "fees on a voided market");
    checkConservation(market, "void");
}

void bracketAndScalar() {
    using namespace wx;
    PredictionMarket bracket(4, params(MarketType::Bracket, "bracket:temp:-inf:200,200:250,250:inf"));
    bracket.initPositionLedgers("owner");
    if (bracket.outcomeCount() != 3) {
        fail("bracket market should have three outcomes");
    }
    bracket.placeBet("alice", Side::Yes, 1, 2 * kUnit, 10);
    bracket.placeBet("bob", Side::Yes, 2, kUnit, 10);
    expectThrows<ValidationError>([&] { bracket.placeBet("carol", Side::Yes, 3, kUnit, 10); }, "unknown bracket");
    expectThrows<ValidationError>(
        [&] { bracket.placeLimitOrder("alice", 1, Side::Yes, 5'000, kUnit, kExpiry, 10); }, "order on a bracket market");
    bracket.settleMarket("oracle", false, 1, 230, "h", kExpiry);
    if (!bracket.settlement().winningBracket || *bracket.settlement().winningBracket != 1) {
        fail("winning bracket not recorded");
    }
    if (bracket.claimWinnings("alice", kExpiry + kWindow).payout != 2'955'000'000ULL) {
        fail("bracket winner should take 3 x (1 - 1.5%)");
    }

    PredictionMarket scalar(5, params(MarketType::Scalar, "scalar:temp:0:400"));
    scalar.initPositionLedgers("owner");
    scalar.placeBet("long", Side::Yes, 0, kUnit, 10);
    scalar.placeBet("short", Side::No, 0, kUnit, 10);
    scalar.settleMarket("oracle", false, 0, 250, "h", kExpiry);
    if (scalar.settlement().longWeightBps != 6'250) {
        fail("scalar weight should be 6250 bps");
    }
    if (scalar.claimWinnings("long", kExpiry + kWindow).payout != 1'231'250'000 ||
        scalar.claimWinnings("short", kExpiry + kWindow).payout != 738'750'000) {
        fail("scalar payouts wrong");
    }

    expectThrows<ValidationError>([] { wx::PredictionMarket bad(6, params(MarketType::Scalar, "binary:temp:gt:1")); },
                                  "scalar market with binary criteria");
}

void reportSettlement() {
    using namespace wx;
    PredictionMarket market(7, params(MarketType::Binary, "binary:temp:gt:250"));
    market.initPositionLedgers("owner");
    market.placeBet("alice", Side::Yes, 0, kUnit, 10);
    market.placeBet("bob", Side::No, 0, kUnit, 10);

    ReportSnapshot report;
    report.key = ReportKey{ 1001, 19'675 };
    report.finalized = true;
    report.disputeActive = true;
    report.aggregate.temperature = 260;
    report.aggregate.sourceHash = "abc";
    report.revision = 1;

    ReportSnapshot wrongKey = report;
    wrongKey.key.dateKey = 1;
    expectThrows<ValidationError>([&] { market.settleFromReport("oracle", wrongKey, kExpiry); }, "report for another key");

    if (market.settleFromReport("oracle", report, kExpiry) != MarketStatus::Disputed) {
        fail("active dispute should park the market in Disputed");
    }
    expectThrows<StateError>([&] { market.settleFromReport("oracle", report, kExpiry + 1); },
                             "settling while still disputed");

    // Upheld ruling rewrote the temperature below the threshold.
    report.disputeActive = false;
    report.revision = 2;
    report.aggregate.temperature = 240;
    if (market.settleFromReport("oracle", report, kExpiry + 10) != MarketStatus::Settled) {
        fail("market should settle once the dispute is resolved");
    }
    if (*market.settlement().outcome || market.settlement().reportRevision != 2 ||
        market.settlement().dataHash != "abc" || market.settlement().settlementValue != 240) {
        fail("report settlement should use the corrected value and record the revision");
    }
    if (market.claimWinnings("bob", kExpiry + 10 + kWindow).payout != 1'970'000'000) {
        fail("NO holder should win after correction");
    }
}

void lifecycleControls() {
    using namespace wx;
    PredictionMarket market(8, params(MarketType::Binary, "binary:temp:gt:250"));
    market.initPositionLedgers("owner");
    market.placeBet("alice", Side::Yes, 0, 3 * kUnit, 10);
    market.placeBet("bob", Side::No, 0, kUnit, 10);

    market.transferPosition("alice", "carol", 0, kUnit);
    if (market.balanceOf("carol", 0) != kUnit || market.getPositionInfo("carol").size() != 2) {
        fail("transfer should move positions");
    }

    expectThrows<AuthorizationError>([&] { market.setPaused("alice", true); }, "pause by a stranger");
    market.setPaused("owner", true);
    expectThrows<StateError>([&] { market.placeBet("bob", Side::No, 0, kUnit, 20); }, "bet while paused");
    expectThrows<StateError>([&] { market.transferPosition("alice", "carol", 0, kUnit); }, "transfer while paused");
    market.setPaused("owner", false);

    expectThrows<StateError>([&] { market.requestResolution(kExpiry - 1); }, "resolution before expiry");
    if (market.requestResolution(kExpiry) != MarketStatus::Resolving) {
        fail("expired market should move to Resolving");
    }
    expectThrows<StateError>([&] { market.requestResolution(kExpiry); }, "resolution requested twice");

    expectThrows<AuthorizationError>([&] { market.cancelMarket("oracle", kExpiry + 5); }, "cancel by non-owner");
    market.cancelMarket("owner", kExpiry + 5);
    if (market.status() != MarketStatus::Cancelled) {
        fail("market should be cancelled");
    }
    if (market.claimWinnings("alice", kExpiry + 5).payout != 2 * kUnit ||
        market.claimWinnings("carol", kExpiry + 5).payout != kUnit ||
        market.claimWinnings("bob", kExpiry + 5).payout != kUnit) {
        fail("cancelled market refunds every holder at par");
    }
    expectThrows<StateError>([&] { market.settleMarket("oracle", true, 0, 0, "h", kExpiry + 6); },
                             "settling a cancelled market");
    checkConservation(market, "cancelled");
}

void limitOrders() {
    using namespace wx;
    PredictionMarket market(9, params(MarketType::Binary, "manual"));
    market.initPositionLedgers("owner");
    market.placeLimitOrder("carol", 1, Side::Yes, 5'000, kUnit, 900, 10);
    market.placeLimitOrder("dave", 2, Side::Yes, 6'000, kUnit, 900, 10);
    if (market.getOrderBook().bestYesBid != 6'000) {
        fail("best bid should be 6000");
    }
    market.cancelLimitOrder("dave", 2, 20);
    if (market.getOrderBook().bestYesBid != 5'000) {
        fail("best bid should return to 5000");
    }
    expectThrows<StateError>([&] { market.placeLimitOrder("erin", 3, Side::No, 100, kUnit, 2'000, kExpiry); },
                             "order after market expiry");
    market.settleMarket("oracle", true, 0, 0, "h", kExpiry);
    if (market.cancelLimitOrder("carol", 1, kExpiry + 1) != kUnit ||
        market.getOrder(1)->status != OrderStatus::Expired) {
        fail("escrow should be reclaimable after settlement");
    }
}

} // namespace

int main() {
    binaryEvenSplit();
    dustAndSweep();
    voidedSettlement();
    bracketAndScalar();
    reportSettlement();
    lifecycleControls();
    limitOrders();
    std::cout << "Market checks passed.\n";
    return 0;
}
