#include "protocol_config.hpp"
#include "request_script.hpp"
#include "settlement_math.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace wx;

int main() {
    ProtocolConfig cfg;
    try {
        cfg = applyEnvironmentOverrides(cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 1;
    }

    std::cout << "=== FEE SCHEDULE ===\n";
    std::cout << "Fee: " << cfg.feeBps << " bps of the total pool\n";
    std::cout << "Creator share: " << cfg.creatorShareBps << " bps of the fee\n";
    std::cout << "Dispute window: " << cfg.disputeWindowSeconds << " s\n";
    std::cout << "Minimum bet: " << formatUnits(cfg.minBet) << "  minimum order: " << formatUnits(cfg.minOrderAmount)
              << "\n\n";

    std::cout << "=== FEE SPLIT BY POOL SIZE ===\n";
    const std::vector<Amount> pools{ kUnit, 20 * kUnit, 1'000 * kUnit, 1'000'000 * kUnit };
    for (Amount pool : pools) {
        FeeBreakdown fees = SettlementMath::applyFees(pool, cfg.feeBps, cfg.creatorShareBps);
        std::cout << "  pool " << std::setw(10) << std::left << formatUnits(pool) << " fee " << std::setw(12)
                  << formatUnits(fees.total) << " creator " << std::setw(12) << formatUnits(fees.creator)
                  << " platform " << std::setw(12) << formatUnits(fees.platform) << " distributable "
                  << formatUnits(fees.distributable) << '\n';
    }

    std::cout << "\n=== WINNER RETURN (binary, winning side share of pool) ===\n";
    const Amount pool = 100 * kUnit;
    for (std::uint32_t shareBps : { 1'000u, 2'500u, 5'000u, 7'500u, 9'000u }) {
        const Amount winningStake = SettlementMath::mulDivFloor(pool, shareBps, kBasisPoints);
        FeeBreakdown fees = SettlementMath::applyFees(pool, cfg.feeBps, cfg.creatorShareBps);
        // Return on one unit staked on the winning side.
        const Amount perUnit = SettlementMath::mulDivFloor(kUnit, fees.distributable, winningStake);
        std::cout << "  winning side " << std::setw(6) << std::left << (shareBps / 100.0) << "% pays "
                  << formatUnits(perUnit) << " per unit\n";
    }

    std::cout << "\n=== SCALAR LONG WEIGHT (range 0..400) ===\n";
    for (std::int64_t value : { -50, 0, 100, 250, 400, 450 }) {
        std::cout << "  value " << std::setw(5) << std::left << value << " long weight "
                  << SettlementMath::scalarLongWeightBps(value, 0, 400) << " bps\n";
    }
    return 0;
}
