#pragma once

#include "ledger_types.hpp"

#include <cstdint>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace wx {

struct FeeBreakdown {
    Amount total = 0;
    Amount platform = 0;
    Amount creator = 0;
    Amount distributable = 0;
};

// Integer-only payout arithmetic. Every product is widened to 128 bits and
// every quotient is floored, so results are identical on every platform.
class SettlementMath {
public:
    using Wide = boost::multiprecision::checked_uint128_t;

    static Amount mulDivFloor(Amount value, Amount numerator, Amount denominator);
    static Amount checkedAdd(Amount lhs, Amount rhs);
    static Amount checkedSub(Amount lhs, Amount rhs);

    static FeeBreakdown applyFees(Amount totalPool, std::uint32_t feeBps, std::uint32_t creatorShareBps);

    // Share of the distributable pool owed to the LONG side of a scalar market.
    static std::uint32_t scalarLongWeightBps(std::int64_t value, std::int64_t rangeMin, std::int64_t rangeMax);

    static std::vector<Amount> allocateWinnerTakesAll(std::size_t outcomeCount,
                                                      std::size_t winner,
                                                      Amount distributable);

    // LONG is outcome 0, SHORT is outcome 1. A side without supply cedes its
    // allocation to the other side.
    static std::vector<Amount> allocateScalar(Amount distributable,
                                              std::uint32_t longWeightBps,
                                              Amount longSupply,
                                              Amount shortSupply);

private:
    static Amount narrow(const Wide& value);
};

} // namespace wx
