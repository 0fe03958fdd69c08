#include "audit_journal.hpp"
#include "exchange.hpp"
#include "protocol_config.hpp"
#include "request_script.hpp"

#include <sodium.h>

#include <array>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

using SecretKey = std::array<unsigned char, crypto_sign_SECRETKEYBYTES>;

// What a replayed session commits to. The signed message is
// "<deployment>:[<chain>:]<script sha256>:<entries>:<root>".
struct LedgerAttestation {
    std::string deploymentId;
    std::string chainId;
    std::string scriptDigest;
    std::size_t entries = 0;
    std::size_t rejected = 0;
    std::string root;
    std::array<unsigned char, crypto_sign_BYTES> signature{};
    std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> publicKey{};

    std::string message() const {
        std::string out = deploymentId + ":";
        if (!chainId.empty()) {
            out += chainId + ":";
        }
        return out + scriptDigest + ":" + std::to_string(entries) + ":" + root;
    }
};

template <std::size_t N>
std::string toHex(const std::array<unsigned char, N>& bytes) {
    std::string hex(N * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

SecretKey parseSecretKey(const std::string& hex) {
    SecretKey key{};
    std::size_t length = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(key.data(), key.size(), hex.c_str(), hex.size(), nullptr, &length, &end) != 0 ||
        end != hex.c_str() + hex.size() || length != key.size()) {
        sodium_memzero(key.data(), key.size());
        throw std::invalid_argument("secret key must be " + std::to_string(key.size()) + " hex-encoded bytes");
    }
    return key;
}

void signAttestation(LedgerAttestation& attestation, SecretKey& secretKey) {
    const std::string message = attestation.message();
    const int derived = crypto_sign_ed25519_sk_to_pk(attestation.publicKey.data(), secretKey.data());
    const int signedOk = derived == 0 ? crypto_sign_detached(attestation.signature.data(),
                                                             nullptr,
                                                             reinterpret_cast<const unsigned char*>(message.data()),
                                                             message.size(),
                                                             secretKey.data())
                                      : -1;
    sodium_memzero(secretKey.data(), secretKey.size());
    if (derived != 0) {
        throw std::runtime_error("unable to derive public key from secret key");
    }
    if (signedOk != 0) {
        throw std::runtime_error("signing failed");
    }
}

std::string toJson(const LedgerAttestation& attestation) {
    std::ostringstream json;
    json << "{\n"
         << "  \"deployment_id\": \"" << attestation.deploymentId << "\",\n";
    if (!attestation.chainId.empty()) {
        json << "  \"chain_id\": \"" << attestation.chainId << "\",\n";
    }
    json << "  \"script_sha256\": \"" << attestation.scriptDigest << "\",\n"
         << "  \"journal_entries\": " << attestation.entries << ",\n"
         << "  \"rejected_requests\": " << attestation.rejected << ",\n"
         << "  \"merkle_root\": \"" << attestation.root << "\",\n"
         << "  \"public_key\": \"" << toHex(attestation.publicKey) << "\",\n"
         << "  \"signature\": \"" << toHex(attestation.signature) << "\"\n"
         << "}\n";
    return json.str();
}

wx::ProtocolConfig signingConfig() {
    wx::ProtocolConfig cfg = wx::applyEnvironmentOverrides(wx::ProtocolConfig{});
    if (std::getenv("WX_DEPLOYMENT_ID") == nullptr || cfg.deploymentId.empty() || cfg.deploymentId == "default") {
        throw std::runtime_error("WX_DEPLOYMENT_ID must name a specific deployment (not \"default\") before signing");
    }
    return cfg;
}

std::string readScript(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("unable to open script: " + path);
    }
    std::ostringstream text;
    text << in.rdbuf();
    return text.str();
}

LedgerAttestation replay(const std::string& scriptText, const std::string& owner, const wx::ProtocolConfig& cfg) {
    wx::WeatherExchange exchange(owner, cfg);
    wx::RequestScript script(exchange);
    std::istringstream in(scriptText);

    LedgerAttestation attestation;
    for (const auto& result : script.run(in)) {
        attestation.rejected += result.ok ? 0 : 1;
    }
    attestation.root = exchange.journalRoot();
    if (attestation.root.empty()) {
        throw std::runtime_error("script produced no journal entries; nothing to sign");
    }
    attestation.deploymentId = cfg.deploymentId;
    attestation.chainId = cfg.chainId;
    attestation.scriptDigest = wx::sha256Hex(scriptText);
    attestation.entries = exchange.audit().size();
    return attestation;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: publish_ledger <script> <secret_key_hex> [owner] [output.json]\n"
                  << "Replays a request script and ed25519-signs its journal root.\n"
                  << "WX_DEPLOYMENT_ID is required; WX_CHAIN_ID adds chain scoping.\n";
        return 1;
    }
    if (sodium_init() < 0) {
        std::cerr << "libsodium failed to initialise\n";
        return 1;
    }

    const std::string owner = argc >= 4 ? argv[3] : "owner";
    const std::string outputPath = argc >= 5 ? argv[4] : "";
    try {
        const wx::ProtocolConfig cfg = signingConfig();
        LedgerAttestation attestation = replay(readScript(argv[1]), owner, cfg);
        SecretKey secretKey = parseSecretKey(argv[2]);
        signAttestation(attestation, secretKey);

        const std::string json = toJson(attestation);
        if (outputPath.empty()) {
            std::cout << json;
            return 0;
        }
        std::ofstream out(outputPath);
        if (!(out << json)) {
            throw std::runtime_error("unable to write " + outputPath);
        }
    } catch (const std::exception& ex) {
        std::cerr << "publish_ledger: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
