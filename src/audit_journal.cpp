#include "audit_journal.hpp"

#include "picosha2.h"

#include <utility>

namespace wx {

namespace {

void appendField(std::string& out, const std::string& field) {
    out += std::to_string(field.size());
    out.push_back(':');
    out += field;
    out.push_back(';');
}

} // namespace

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

AuditJournal::AuditJournal(std::string scope) : scope_(std::move(scope)) {}

std::string AuditJournal::canonicalRecord(const std::string& scope, const AuditEntry& entry) {
    std::string out;
    appendField(out, scope);
    appendField(out, std::to_string(entry.sequence));
    appendField(out, std::to_string(entry.at));
    appendField(out, entry.actor);
    appendField(out, entry.action);
    appendField(out, entry.detail);
    return out;
}

const AuditEntry& AuditJournal::append(Timestamp at,
                                       const Identity& actor,
                                       const std::string& action,
                                       const std::string& detail) {
    AuditEntry entry;
    entry.sequence = entries_.size();
    entry.at = at;
    entry.actor = actor;
    entry.action = action;
    entry.detail = detail;
    entry.leafHash = sha256Hex(canonicalRecord(scope_, entry));
    entries_.push_back(std::move(entry));
    return entries_.back();
}

std::string AuditJournal::hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

std::string AuditJournal::merkleRoot() const {
    if (entries_.empty()) {
        return {};
    }

    std::vector<std::string> layer;
    layer.reserve(entries_.size());
    for (const auto& entry : entries_) {
        layer.push_back(entry.leafHash);
    }
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<std::string> AuditJournal::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= entries_.size()) {
        return proof;
    }

    std::vector<std::string> layer;
    layer.reserve(entries_.size());
    for (const auto& entry : entries_) {
        layer.push_back(entry.leafHash);
    }
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& left = layer[i];
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            if (i == index || i + 1 == index) {
                proof.push_back(i == index ? right : left);
            }
            next.push_back(hashPair(left, right));
        }
        index /= 2;
        layer = std::move(next);
    }
    return proof;
}

bool AuditJournal::verifyProof(const std::string& leafHash,
                               std::size_t leafIndex,
                               std::size_t leafCount,
                               const std::vector<std::string>& proof,
                               const std::string& root) {
    if (leafIndex >= leafCount) {
        return false;
    }
    std::string current = leafHash;
    std::size_t index = leafIndex;
    std::size_t width = leafCount;
    std::size_t step = 0;
    while (width > 1) {
        if (step >= proof.size()) {
            return false;
        }
        const std::string& sibling = proof[step++];
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
        width = (width + 1) / 2;
    }
    return step == proof.size() && current == root;
}

} // namespace wx
