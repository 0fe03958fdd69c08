#include "settlement_math.hpp"

#include "errors.hpp"

#include <limits>
#include <stdexcept>

namespace wx {

Amount SettlementMath::narrow(const Wide& value) {
    if (value > Wide(std::numeric_limits<Amount>::max())) {
        throw std::overflow_error("settlement amount exceeds 64-bit range");
    }
    return value.convert_to<Amount>();
}

Amount SettlementMath::mulDivFloor(Amount value, Amount numerator, Amount denominator) {
    if (denominator == 0) {
        throw std::domain_error("mulDivFloor denominator is zero");
    }
    Wide product = Wide(value) * Wide(numerator);
    return narrow(product / Wide(denominator));
}

Amount SettlementMath::checkedAdd(Amount lhs, Amount rhs) {
    return narrow(Wide(lhs) + Wide(rhs));
}

Amount SettlementMath::checkedSub(Amount lhs, Amount rhs) {
    if (rhs > lhs) {
        throw InvariantViolation("settlement subtraction would underflow");
    }
    return lhs - rhs;
}

FeeBreakdown SettlementMath::applyFees(Amount totalPool,
                                       std::uint32_t feeBps,
                                       std::uint32_t creatorShareBps) {
    if (feeBps >= kBasisPoints || creatorShareBps > kBasisPoints) {
        throw std::invalid_argument("fee schedule out of range");
    }
    FeeBreakdown out;
    out.total = mulDivFloor(totalPool, feeBps, kBasisPoints);
    out.creator = mulDivFloor(out.total, creatorShareBps, kBasisPoints);
    out.platform = out.total - out.creator;
    out.distributable = totalPool - out.total;
    return out;
}

std::uint32_t SettlementMath::scalarLongWeightBps(std::int64_t value,
                                                  std::int64_t rangeMin,
                                                  std::int64_t rangeMax) {
    if (rangeMax <= rangeMin) {
        throw std::invalid_argument("scalar range must have max above min");
    }
    if (value <= rangeMin) {
        return 0;
    }
    if (value >= rangeMax) {
        return kBasisPoints;
    }
    // Unsigned wraparound yields the exact distance for min < value < max.
    Amount offset = static_cast<Amount>(value) - static_cast<Amount>(rangeMin);
    Amount width = static_cast<Amount>(rangeMax) - static_cast<Amount>(rangeMin);
    return static_cast<std::uint32_t>(mulDivFloor(offset, kBasisPoints, width));
}

std::vector<Amount> SettlementMath::allocateWinnerTakesAll(std::size_t outcomeCount,
                                                           std::size_t winner,
                                                           Amount distributable) {
    if (winner >= outcomeCount) {
        throw std::out_of_range("winning outcome out of range");
    }
    std::vector<Amount> allocations(outcomeCount, 0);
    allocations[winner] = distributable;
    return allocations;
}

std::vector<Amount> SettlementMath::allocateScalar(Amount distributable,
                                                   std::uint32_t longWeightBps,
                                                   Amount longSupply,
                                                   Amount shortSupply) {
    if (longWeightBps > kBasisPoints) {
        throw std::invalid_argument("scalar weight above 10000 bps");
    }
    Amount longShare = mulDivFloor(distributable, longWeightBps, kBasisPoints);
    Amount shortShare = distributable - longShare;
    if (longSupply == 0) {
        shortShare += longShare;
        longShare = 0;
    }
    if (shortSupply == 0) {
        longShare += shortShare;
        shortShare = 0;
    }
    return { longShare, shortShare };
}

} // namespace wx
