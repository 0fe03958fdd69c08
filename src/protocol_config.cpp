#include "protocol_config.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace wx {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::string readEnv(const char* name) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return "";
    }
    return trim(env);
}

std::uint64_t parseUnsigned(const char* name, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error(std::string(name) + " must be an unsigned integer, got \"" + text + "\"");
    }
    try {
        return std::stoull(text);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string(name) + " out of range: " + ex.what());
    }
}

std::uint32_t parseBps(const char* name, const std::string& text) {
    std::uint64_t value = parseUnsigned(name, text);
    if (value > kBasisPoints) {
        std::ostringstream oss;
        oss << name << " must be at most " << kBasisPoints << " basis points, got " << value;
        throw std::runtime_error(oss.str());
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

void validateConfig(const ProtocolConfig& cfg) {
    if (cfg.temperatureTolerance < 0) {
        throw std::invalid_argument("temperatureTolerance must not be negative");
    }
    if (cfg.minReportsForConsensus < 2) {
        throw std::invalid_argument("consensus needs at least two independent reports");
    }
    if (cfg.disputeStake == 0) {
        throw std::invalid_argument("disputeStake must be positive");
    }
    if (cfg.escalationStake <= cfg.disputeStake) {
        throw std::invalid_argument("escalationStake must exceed disputeStake");
    }
    if (cfg.minBet == 0 || cfg.minOrderAmount == 0) {
        throw std::invalid_argument("minimum bet and order amounts must be positive");
    }
    if (cfg.feeBps >= kBasisPoints) {
        throw std::invalid_argument("feeBps must be below 10000");
    }
    if (cfg.creatorShareBps > kBasisPoints) {
        throw std::invalid_argument("creatorShareBps must not exceed 10000");
    }
}

ProtocolConfig applyEnvironmentOverrides(ProtocolConfig cfg) {
    std::string deployment = readEnv("WX_DEPLOYMENT_ID");
    if (!deployment.empty()) {
        cfg.deploymentId = deployment;
    }
    std::string chain = readEnv("WX_CHAIN_ID");
    if (!chain.empty()) {
        cfg.chainId = chain;
    }
    std::string window = readEnv("WX_DISPUTE_WINDOW_SECONDS");
    if (!window.empty()) {
        cfg.disputeWindowSeconds = parseUnsigned("WX_DISPUTE_WINDOW_SECONDS", window);
    }
    std::string fee = readEnv("WX_FEE_BPS");
    if (!fee.empty()) {
        cfg.feeBps = parseBps("WX_FEE_BPS", fee);
    }
    std::string creatorShare = readEnv("WX_CREATOR_SHARE_BPS");
    if (!creatorShare.empty()) {
        cfg.creatorShareBps = parseBps("WX_CREATOR_SHARE_BPS", creatorShare);
    }
    validateConfig(cfg);
    return cfg;
}

std::string deploymentScope(const ProtocolConfig& cfg) {
    if (cfg.deploymentId.empty()) {
        throw std::runtime_error("deploymentId must not be empty");
    }
    std::string scope = cfg.deploymentId;
    if (!cfg.chainId.empty()) {
        scope += "|" + cfg.chainId;
    }
    return scope;
}

} // namespace wx
