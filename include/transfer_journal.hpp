#pragma once

#include "ledger_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace wx {

enum class TransferKind : std::uint8_t {
    // inbound
    DisputeStake,
    EscalationStake,
    Bet,
    OrderEscrow,
    // outbound
    DisputeRefund,
    DisputeForfeit,
    Payout,
    Refund,
    CreatorFee,
    PlatformFee,
    DustSweep,
    OrderRefund
};

const char* transferKindName(TransferKind kind);
bool isInbound(TransferKind kind);

struct TransferRecord {
    std::uint64_t sequence = 0;
    Timestamp at = 0;
    TransferKind kind = TransferKind::Bet;
    Identity counterparty;
    Amount amount = 0;
    std::string reference;
};

// Every value movement across the system boundary, in order.
class TransferJournal {
public:
    void record(Timestamp at, TransferKind kind, const Identity& counterparty, Amount amount, std::string reference);

    const std::vector<TransferRecord>& records() const { return records_; }
    Amount totalIn() const { return totalIn_; }
    Amount totalOut() const { return totalOut_; }
    Amount total(TransferKind kind) const;
    // Net value received by one identity.
    std::int64_t netFor(const Identity& counterparty) const;

private:
    std::vector<TransferRecord> records_;
    Amount totalIn_ = 0;
    Amount totalOut_ = 0;
};

} // namespace wx
