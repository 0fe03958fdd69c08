#include "exchange.hpp"
#include "protocol_config.hpp"
#include "request_script.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wx;

namespace {

void printUsage() {
    std::cerr << "Usage: wxmarket [--owner <identity>] [--strict] [script]\n";
    std::cerr << "Reads requests from script (or stdin) and prints one result per request.\n";
    std::cerr << "Environment: WX_DEPLOYMENT_ID, WX_CHAIN_ID, WX_DISPUTE_WINDOW_SECONDS, WX_FEE_BPS, "
                 "WX_CREATOR_SHARE_BPS.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string owner = "owner";
    std::string scriptPath;
    bool strict = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--owner" && i + 1 < argc) {
            owner = argv[++i];
        } else if (arg == "--strict") {
            strict = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (scriptPath.empty() && arg.rfind("--", 0) != 0) {
            scriptPath = arg;
        } else {
            printUsage();
            return 1;
        }
    }

    ProtocolConfig cfg;
    try {
        cfg = applyEnvironmentOverrides(cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    WeatherExchange exchange(owner, cfg);
    RequestScript script(exchange);

    std::cout << "Using deploymentId=" << cfg.deploymentId;
    if (!cfg.chainId.empty()) {
        std::cout << " chainId=" << cfg.chainId;
    }
    std::cout << " owner=" << owner << " (set WX_DEPLOYMENT_ID/WX_CHAIN_ID to override)\n";

    std::vector<ScriptResult> results;
    if (scriptPath.empty()) {
        results = script.run(std::cin);
    } else {
        std::ifstream in(scriptPath);
        if (!in) {
            std::cerr << "Unable to open script: " << scriptPath << "\n";
            return 1;
        }
        results = script.run(in);
    }

    std::size_t rejected = 0;
    for (const auto& result : results) {
        if (!result.ok) {
            ++rejected;
        }
        std::cout << "[" << result.line << "] " << (result.ok ? "ok " : "ERR ") << result.command << ": "
                  << result.message << "\n";
    }

    const TransferJournal& transfers = exchange.transfers();
    std::cout << "\nRequests: " << results.size() << " accepted: " << (results.size() - rejected)
              << " rejected: " << rejected << "\n";
    std::cout << "Value in: " << formatUnits(transfers.totalIn()) << "  out: " << formatUnits(transfers.totalOut())
              << "\n";
    std::cout << "Journal entries: " << exchange.audit().size() << "\n";
    std::cout << "Journal Merkle root: " << exchange.journalRoot() << "\n";

    if (strict && rejected != 0) {
        return 2;
    }
    return 0;
}
