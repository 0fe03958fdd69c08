#pragma once

#include "ledger_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wx {

std::string sha256Hex(const std::string& data);

struct AuditEntry {
    std::uint64_t sequence = 0;
    Timestamp at = 0;
    Identity actor;
    std::string action;
    std::string detail;
    std::string leafHash;
};

// Append-only transcript of accepted transitions. Each entry is hashed in a
// length-prefixed canonical form and the leaves are folded into a binary
// Merkle tree; an odd node is paired with itself.
class AuditJournal {
public:
    explicit AuditJournal(std::string scope);

    const AuditEntry& append(Timestamp at,
                             const Identity& actor,
                             const std::string& action,
                             const std::string& detail);

    const std::vector<AuditEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    const std::string& scope() const { return scope_; }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            std::size_t leafCount,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    static std::string canonicalRecord(const std::string& scope, const AuditEntry& entry);

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::string scope_;
    std::vector<AuditEntry> entries_;
};

} // namespace wx
