#include "errors.hpp"
#include "exchange.hpp"
#include "protocol_config.hpp"
#include "request_script.hpp"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "exchange_test failure: " << msg << std::endl;
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

constexpr wx::Timestamp kStart = 1'700'000'000;
constexpr wx::Timestamp kExpiry = 1'700'086'400;

std::string run(wx::RequestScript& script, const std::string& line) {
    wx::ScriptResult result = script.execute(line);
    if (!result.ok) {
        fail("'" + line + "' was rejected: " + result.message);
    }
    return result.message;
}

void expectMessage(wx::RequestScript& script, const std::string& line, const std::string& expected) {
    const std::string message = run(script, line);
    if (message != expected) {
        fail("'" + line + "' answered '" + message + "', expected '" + expected + "'");
    }
}

void expectRejected(wx::RequestScript& script, const std::string& line) {
    wx::ScriptResult result = script.execute(line);
    if (result.ok) {
        fail("'" + line + "' should have been rejected");
    }
}

void checkUnits() {
    using wx::formatUnits;
    using wx::parseUnits;
    if (parseUnits("10") != 10 * wx::kUnit || parseUnits("0.1") != wx::kUnit / 10 ||
        parseUnits("10.5") != 10'500'000'000ULL || parseUnits(".25") != 250'000'000) {
        fail("decimal unit parsing");
    }
    if (formatUnits(19'700'000'000ULL) != "19.7" || formatUnits(1) != "0.000000001" || formatUnits(0) != "0") {
        fail("decimal unit formatting");
    }
    expectThrows<wx::ValidationError>([] { parseUnits("1.0000000001"); }, "ten decimals");
    expectThrows<wx::ValidationError>([] { parseUnits("1e9"); }, "exponent notation");
    expectThrows<wx::ValidationError>([] { parseUnits("99999999999999999999"); }, "amount overflow");

    auto tokens = wx::RequestScript::tokenize("create-market c \"two words\" x # trailing");
    if (tokens.size() != 4 || tokens[2] != "two words") {
        fail("tokenizer should group quotes and drop comments");
    }
    expectThrows<wx::ValidationError>([] { wx::RequestScript::tokenize("bad \"quote"); }, "unterminated quote");
}

void scriptedLifecycle() {
    wx::WeatherExchange exchange("admin", wx::ProtocolConfig{});
    wx::RequestScript script(exchange, kStart);

    run(script, "add-reporter admin r1 \"Station One\" station");
    run(script, "add-reporter admin r2 \"Station Two\" satellite");
    run(script, "add-arbitrator admin arb1 Arbiter 1");
    expectRejected(script, "add-reporter mallory r3 Intruder station");

    expectMessage(script,
                  "create-market creator binary 1001 19675 1700086400 binary:temp:gt:250 \"Above 25C in Reykjavik\"",
                  "market 1 created");
    if (exchange.market(1).params().oracle != wx::WeatherExchange::kResolverAddress ||
        exchange.market(1).status() != wx::MarketStatus::Active) {
        fail("new market should be active and bound to the resolver");
    }
    expectRejected(script, "init-positions admin m1");

    run(script, "bet m1 alice yes 0 10");
    run(script, "bet m1 bob no 0 10");
    expectRejected(script, "bet m1 bob no 0 0.05");

    run(script, "order m1 carol 1 yes 5000 2 1700090000");
    run(script, "order m1 dave 2 yes 6000 1 1700090000");
    expectMessage(script, "show-book m1", "book yes=6000 no=0 active=2 yesVolume=3 noVolume=0 escrow=3");
    expectMessage(script, "cancel-order m1 dave 2", "order 2 refunded 1");
    expectMessage(script, "show-book m1", "book yes=5000 no=0 active=1 yesVolume=2 noVolume=0 escrow=2");

    expectMessage(script, "report r1 1001 19675 260 300 200 0 10000 5 9 1013 60 clear h1", "report 1001/19675 pending");
    expectMessage(script,
                  "report r2 1001 19675 262 305 198 0 10000 6 10 1012 62 clear h2",
                  "report 1001/19675 finalized");
    expectRejected(script, "settle-report admin m1");

    run(script, "at 1700086400");
    expectRejected(script, "bet m1 alice yes 0 1");
    expectRejected(script, "settle-report keeper m1");
    expectMessage(script, "settle-report admin m1", "market 1 settled");
    const wx::SettlementRecord& record = exchange.market(1).settlement();
    if (!record.outcome || !*record.outcome || record.settlementValue != 261 || record.reportRevision != 1) {
        fail("market should settle YES on the consensus temperature");
    }

    // A retroactive correction does not reopen a settled market.
    expectMessage(script, "dispute erin 1001 19675 10 \"miscalibrated sensor\"", "dispute 0 open on 1001/19675");
    expectRejected(script, "resolve arb1 0 uphold no 240 early");
    run(script, "escalate erin 0 25 \"calibration log\"");
    run(script, "vote arb1 0 uphold \"log confirms\"");
    expectMessage(script, "resolve arb1 0 uphold no 240 corrected", "dispute 0 upheld, 35 to erin");
    if (exchange.getReport(wx::ReportKey{ 1001, 19'675 })->revision != 2 ||
        exchange.market(1).settlement().reportRevision != 1 || !*exchange.market(1).settlement().outcome) {
        fail("settled market should keep the revision it settled on");
    }

    expectRejected(script, "claim m1 alice");
    run(script, "advance 3600");
    expectMessage(script, "claim m1 alice", "alice paid 19.7");
    expectMessage(script, "claim m1 bob", "bob paid 0");
    expectRejected(script, "claim m1 bob");
    expectMessage(script, "collect-fees creator m1", "creator 0.12 platform 0.18");
    expectMessage(script, "sweep-dust admin m1", "swept 0");
    expectMessage(script, "cancel-order m1 carol 1", "order 1 refunded 2");
    expectMessage(script, "show-order m1 1", "order 1 expired yes @5000 2");

    const wx::TransferJournal& transfers = exchange.transfers();
    if (transfers.totalIn() != 58 * wx::kUnit || transfers.totalOut() != 58 * wx::kUnit) {
        fail("value in and out should both be 58 units");
    }
    if (transfers.total(wx::TransferKind::DisputeRefund) != 35 * wx::kUnit ||
        transfers.netFor("alice") != 9'700'000'000LL || transfers.netFor("bob") != -10'000'000'000LL) {
        fail("per-party transfer totals");
    }

    const std::size_t entries = exchange.audit().size();
    expectRejected(script, "sweep-dust admin m1");
    if (exchange.audit().size() != entries) {
        fail("rejected requests must not be journaled");
    }
    const std::string journal = run(script, "show-journal");
    if (journal.find("root=" + exchange.journalRoot()) == std::string::npos) {
        fail("show-journal should print the current root");
    }
}

void disputedMarket() {
    using namespace wx;
    WeatherExchange exchange("admin", ProtocolConfig{});
    exchange.addReporter("admin", "r1", "Station One", "station", kStart);
    exchange.addReporter("admin", "r2", "Station Two", "station", kStart);
    exchange.addArbitrator("admin", "arb1", "Arbiter", 2, kStart);

    MarketRequest request;
    request.description = "Above 25C";
    request.locationId = 1002;
    request.dateKey = 19'675;
    request.expiry = kExpiry;
    request.type = MarketType::Binary;
    request.criteria = "temp > 250";
    const std::uint64_t id = exchange.createMarket("creator", request, kStart);

    MarketRequest manual = request;
    manual.oracle = "weather-desk";
    manual.criteria = "manual";
    const std::uint64_t manualId = exchange.createMarket("creator", manual, kStart);

    exchange.placeBet("alice", id, Side::Yes, 0, 5 * kUnit, kStart + 1);
    exchange.placeBet("bob", id, Side::No, 0, 5 * kUnit, kStart + 1);

    WeatherReading reading;
    reading.temperature = 255;
    reading.sourceHash = "s1";
    exchange.submitReport("r1", ReportKey{ 1002, 19'675 }, reading, kStart + 2);
    reading.temperature = 257;
    reading.sourceHash = "s2";
    exchange.submitReport("r2", ReportKey{ 1002, 19'675 }, reading, kStart + 2);

    expectThrows<AuthorizationError>([&] { exchange.settleFromReport("admin", manualId, kExpiry); },
                                     "report settlement of a market with its own oracle");

    expectThrows<AuthorizationError>([&] { exchange.settleFromReport("keeper", id, kExpiry); },
                                     "report settlement by an outsider");
    const std::uint64_t disputeId =
        exchange.disputeResolution("frank", ReportKey{ 1002, 19'675 }, "sensor in direct sun", 10 * kUnit, kExpiry);
    if (exchange.settleFromReport(WeatherExchange::kResolverAddress, id, kExpiry) != MarketStatus::Disputed) {
        fail("active dispute should move the market to Disputed");
    }
    expectThrows<StateError>([&] { exchange.settleFromReport(WeatherExchange::kResolverAddress, id, kExpiry); }, "settling while disputed");

    exchange.escalateDispute("frank", disputeId, "shade photos", 25 * kUnit, kExpiry + 10);
    exchange.arbitratorVote("arb1", disputeId, true, "photos convincing", kExpiry + 20);
    DisputeSettlement ruling = exchange.resolveDispute("arb1", disputeId, true, false, 245, "corrected", kExpiry + 30);
    if (ruling.recipient != "frank" || ruling.amount != 35 * kUnit) {
        fail("upheld dispute should refund both stakes");
    }

    if (exchange.settleFromReport(WeatherExchange::kResolverAddress, id, kExpiry + 40) != MarketStatus::Settled) {
        fail("market should settle after the ruling");
    }
    const SettlementRecord& record = exchange.market(id).settlement();
    if (*record.outcome || record.settlementValue != 245 || record.reportRevision != 2) {
        fail("settlement should follow the corrected report");
    }

    const Timestamp after = kExpiry + 40 + 3'600;
    if (exchange.claimWinnings("bob", id, after).payout != 9'850'000'000ULL) {
        fail("bob should collect 10 units less the 1.5% fee");
    }
    if (exchange.claimWinnings("alice", id, after).payout != 0) {
        fail("alice holds the losing side");
    }
    exchange.collectFees("admin", id, after);
    exchange.cancelMarket("admin", manualId, after);

    if (exchange.transfers().totalIn() != exchange.transfers().totalOut()) {
        fail("all value should have left the exchange");
    }
    if (exchange.transfers().total(TransferKind::PlatformFee) != 90'000'000) {
        fail("platform share of a 0.15 unit fee");
    }

    exchange.pauseFactory("admin", true, after);
    expectThrows<StateError>([&] { exchange.createMarket("creator", request, after); }, "create while paused");
    expectThrows<ValidationError>([&] { exchange.placeBet("alice", 99, Side::Yes, 0, kUnit, after); }, "unknown market");
}


void correctionJudgedPerMarket() {
    using namespace wx;
    WeatherExchange exchange("admin", ProtocolConfig{});
    exchange.addReporter("admin", "r1", "Station One", "station", kStart);
    exchange.addReporter("admin", "r2", "Station Two", "station", kStart);
    exchange.addArbitrator("admin", "arb1", "Arbiter", 1, kStart);

    MarketRequest request;
    request.description = "High above 25C";
    request.locationId = 1003;
    request.dateKey = 19'675;
    request.expiry = kExpiry;
    request.type = MarketType::Binary;
    request.criteria = "binary:temp:gt:250";
    const std::uint64_t warm = exchange.createMarket("creator", request, kStart);
    request.description = "High below 25C";
    request.criteria = "binary:temp:lt:250";
    const std::uint64_t cool = exchange.createMarket("creator", request, kStart);
    request.description = "Any rain";
    request.criteria = "binary:precipitation:gt:5";
    const std::uint64_t wet = exchange.createMarket("creator", request, kStart);

    for (std::uint64_t id : { warm, cool, wet }) {
        exchange.placeBet("alice", id, Side::Yes, 0, kUnit, kStart + 1);
        exchange.placeBet("bob", id, Side::No, 0, kUnit, kStart + 1);
    }

    const ReportKey key{ 1003, 19'675 };
    WeatherReading reading;
    reading.temperature = 260;
    reading.sourceHash = "a";
    exchange.submitReport("r1", key, reading, kStart + 2);
    reading.sourceHash = "b";
    exchange.submitReport("r2", key, reading, kStart + 2);

    const std::uint64_t disputeId = exchange.disputeResolution("frank", key, "sensor in direct sun", 10 * kUnit, kExpiry);
    exchange.escalateDispute("frank", disputeId, "shade photos", 25 * kUnit, kExpiry);
    exchange.arbitratorVote("arb1", disputeId, true, "photos convincing", kExpiry);
    // The stated ruling is NO, phrased for the "above 25C" market.
    exchange.resolveDispute("arb1", disputeId, true, false, 240, "corrected", kExpiry);

    for (std::uint64_t id : { warm, cool, wet }) {
        if (exchange.settleFromReport("admin", id, kExpiry + 1) != MarketStatus::Settled) {
            fail("market " + std::to_string(id) + " should settle on the corrected report");
        }
    }
    if (*exchange.market(warm).settlement().outcome) {
        fail("240 is not above 250");
    }
    if (!*exchange.market(cool).settlement().outcome || exchange.market(cool).settlement().settlementValue != 240) {
        fail("240 is below 250, the opposite market must settle YES");
    }
    if (*exchange.market(wet).settlement().outcome || exchange.market(wet).settlement().settlementValue != 0) {
        fail("precipitation market should judge its own field");
    }
}

} // namespace

int main() {
    checkUnits();
    scriptedLifecycle();
    disputedMarket();
    correctionJudgedPerMarket();
    std::cout << "Exchange checks passed.\n";
    return 0;
}
