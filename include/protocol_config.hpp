#pragma once

#include "ledger_types.hpp"

#include <cstdint>
#include <string>

namespace wx {

struct ProtocolConfig {
    std::string deploymentId = "default";
    std::string chainId;

    // Consensus: temperature is Celsius x10, so 10 is +/-1.0 C.
    std::int64_t temperatureTolerance = 10;
    std::uint32_t minReportsForConsensus = 2;

    Amount disputeStake = 10 * kUnit;
    Amount escalationStake = 25 * kUnit;

    Amount minBet = kUnit / 10;
    Amount minOrderAmount = kUnit / 10;

    Timestamp disputeWindowSeconds = 3'600;

    // Fee on the total pool, and the creator's cut of that fee.
    std::uint32_t feeBps = 150;
    std::uint32_t creatorShareBps = 4'000;
};

void validateConfig(const ProtocolConfig& cfg);

// Reads WX_DEPLOYMENT_ID, WX_CHAIN_ID, WX_DISPUTE_WINDOW_SECONDS, WX_FEE_BPS and
// WX_CREATOR_SHARE_BPS on top of cfg. Malformed values throw.
ProtocolConfig applyEnvironmentOverrides(ProtocolConfig cfg);

// Deployment scope label used to bind journal roots and signatures.
std::string deploymentScope(const ProtocolConfig& cfg);

} // namespace wx
