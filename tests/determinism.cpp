#include "audit_journal.hpp"
#include "exchange.hpp"
#include "protocol_config.hpp"
#include "request_script.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

const char* kSession = R"(# two stations agree, one dispute rejected
at 1700000000
add-reporter admin r1 "Station One" station
add-reporter admin r2 "Station Two" satellite
add-arbitrator admin arb1 Arbiter 3
create-market creator bracket 1001 19675 1700086400 bracket:temp:-inf:200,200:250,250:inf "Reykjavik high"
bet m1 alice yes 0 4
bet m1 bob yes 1 3.5
bet m1 carol yes 2 2.25
report r1 1001 19675 231 280 190 12 9000 7 12 1009 81 rain h-r1
report r2 1001 19675 236 282 188 10 9500 6 11 1010 79 rain h-r2
at 1700086400
dispute dave 1001 19675 10 "wrong station"
escalate dave 0 25 "map"
vote arb1 0 reject "station is correct"
resolve arb1 0 reject no 0 "station is correct"
settle-report admin m1
advance 3600
claim m1 bob
claim m1 alice
collect-fees admin m1
sweep-dust admin m1
)";

struct Run {
    std::unique_ptr<wx::WeatherExchange> exchange;
    std::size_t rejected = 0;
};

Run replay(const wx::ProtocolConfig& cfg) {
    Run out;
    out.exchange = std::make_unique<wx::WeatherExchange>("admin", cfg);
    wx::RequestScript script(*out.exchange);
    std::istringstream in(kSession);
    for (const wx::ScriptResult& result : script.run(in)) {
        if (!result.ok) {
            std::cerr << "line " << result.line << " rejected: " << result.message << "\n";
            ++out.rejected;
        }
    }
    return out;
}

} // namespace

int main() {
    wx::ProtocolConfig cfg;
    cfg.deploymentId = "determinism-suite";
    cfg.chainId = "test-chain";

    Run a = replay(cfg);
    Run b = replay(cfg);
    if (a.rejected != 0 || b.rejected != 0) {
        std::cerr << "Session lines were rejected\n";
        return 1;
    }

    const std::string root = a.exchange->journalRoot();
    if (root.empty() || root != b.exchange->journalRoot() ||
        a.exchange->audit().size() != b.exchange->audit().size()) {
        std::cerr << "Journal root diverged across identical runs\n";
        return 1;
    }

    const wx::TransferJournal& transfers = a.exchange->transfers();
    if (transfers.totalIn() != transfers.totalOut()) {
        std::cerr << "Value in " << transfers.totalIn() << " does not match value out " << transfers.totalOut()
                  << "\n";
        return 1;
    }

    const wx::AuditJournal& journal = a.exchange->audit();
    for (std::size_t i = 0; i < journal.size(); ++i) {
        if (!wx::AuditJournal::verifyProof(
                journal.entries()[i].leafHash, i, journal.size(), journal.merkleProof(i), root)) {
            std::cerr << "Merkle proof failed for entry " << i << "\n";
            return 1;
        }
    }
    if (wx::AuditJournal::verifyProof(journal.entries()[0].leafHash, 1, journal.size(), journal.merkleProof(0), root)) {
        std::cerr << "Merkle proof accepted at the wrong index\n";
        return 1;
    }

    wx::ProtocolConfig otherCfg = cfg;
    otherCfg.chainId = "other-chain";
    Run c = replay(otherCfg);
    if (c.exchange->journalRoot() == root) {
        std::cerr << "Journal root is not bound to the deployment\n";
        return 1;
    }

    std::cout << "Determinism check passed. Merkle root: " << root << "\n";
    return 0;
}
