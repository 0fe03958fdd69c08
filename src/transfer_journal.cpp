#include "transfer_journal.hpp"

#include "settlement_math.hpp"

#include <utility>

namespace wx {

const char* transferKindName(TransferKind kind) {
    switch (kind) {
    case TransferKind::DisputeStake:
        return "dispute-stake";
    case TransferKind::EscalationStake:
        return "escalation-stake";
    case TransferKind::Bet:
        return "bet";
    case TransferKind::OrderEscrow:
        return "order-escrow";
    case TransferKind::DisputeRefund:
        return "dispute-refund";
    case TransferKind::DisputeForfeit:
        return "dispute-forfeit";
    case TransferKind::Payout:
        return "payout";
    case TransferKind::Refund:
        return "refund";
    case TransferKind::CreatorFee:
        return "creator-fee";
    case TransferKind::PlatformFee:
        return "platform-fee";
    case TransferKind::DustSweep:
        return "dust-sweep";
    case TransferKind::OrderRefund:
        return "order-refund";
    }
    return "unknown";
}

bool isInbound(TransferKind kind) {
    switch (kind) {
    case TransferKind::DisputeStake:
    case TransferKind::EscalationStake:
    case TransferKind::Bet:
    case TransferKind::OrderEscrow:
        return true;
    default:
        return false;
    }
}

void TransferJournal::record(Timestamp at,
                             TransferKind kind,
                             const Identity& counterparty,
                             Amount amount,
                             std::string reference) {
    if (amount == 0) {
        return;
    }
    if (isInbound(kind)) {
        totalIn_ = SettlementMath::checkedAdd(totalIn_, amount);
    } else {
        totalOut_ = SettlementMath::checkedAdd(totalOut_, amount);
    }
    TransferRecord entry;
    entry.sequence = records_.size();
    entry.at = at;
    entry.kind = kind;
    entry.counterparty = counterparty;
    entry.amount = amount;
    entry.reference = std::move(reference);
    records_.push_back(std::move(entry));
}

Amount TransferJournal::total(TransferKind kind) const {
    Amount sum = 0;
    for (const auto& entry : records_) {
        if (entry.kind == kind) {
            sum = SettlementMath::checkedAdd(sum, entry.amount);
        }
    }
    return sum;
}

std::int64_t TransferJournal::netFor(const Identity& counterparty) const {
    std::int64_t net = 0;
    for (const auto& entry : records_) {
        if (entry.counterparty != counterparty) {
            continue;
        }
        const auto amount = static_cast<std::int64_t>(entry.amount);
        net += isInbound(entry.kind) ? -amount : amount;
    }
    return net;
}

} // namespace wx
