#include "errors.hpp"
#include "settlement_math.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "settlement_math_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Error, typename Fn>
void expectThrows(Fn&& fn, const std::string& what) {
    try {
        fn();
    } catch (const Error&) {
        return;
    } catch (const std::exception& ex) {
        fail(what + " threw the wrong error: " + ex.what());
    }
    fail(what + " did not throw");
}

} // namespace

int main() {
    using namespace wx;

    // 20 units at 1.5% with a 40% creator cut.
    FeeBreakdown fees = SettlementMath::applyFees(20 * kUnit, 150, 4'000);
    if (fees.total != 300'000'000 || fees.creator != 120'000'000 || fees.platform != 180'000'000) {
        fail("fee split for a 20 unit pool is wrong");
    }
    if (fees.distributable != 19'700'000'000ULL) {
        fail("distributable pool should be 19.7 units");
    }
    if (fees.total + fees.distributable != 20 * kUnit) {
        fail("fee and distributable must add up to the pool");
    }

    // Flat 2% fee with no creator share.
    FeeBreakdown flat = SettlementMath::applyFees(100, 200, 0);
    if (flat.total != 2 || flat.creator != 0 || flat.platform != 2 || flat.distributable != 98) {
        fail("flat 2% fee is wrong");
    }

    // Tiny pools floor the fee to zero.
    FeeBreakdown tiny = SettlementMath::applyFees(50, 150, 4'000);
    if (tiny.total != 0 || tiny.distributable != 50) {
        fail("fee on a 50 base unit pool should floor to zero");
    }

    if (SettlementMath::mulDivFloor(7, 1, 2) != 3) {
        fail("mulDivFloor must floor");
    }
    const auto max = std::numeric_limits<Amount>::max();
    if (SettlementMath::mulDivFloor(max, max, max) != max) {
        fail("mulDivFloor must widen intermediate products");
    }
    expectThrows<std::domain_error>([] { SettlementMath::mulDivFloor(1, 1, 0); }, "zero denominator");
    expectThrows<std::overflow_error>([&] { SettlementMath::mulDivFloor(max, 2, 1); }, "narrowing overflow");
    expectThrows<std::overflow_error>([&] { SettlementMath::checkedAdd(max, 1); }, "checked add overflow");
    expectThrows<InvariantViolation>([] { SettlementMath::checkedSub(1, 2); }, "checked sub underflow");
    expectThrows<std::invalid_argument>([] { SettlementMath::applyFees(100, 10'000, 0); }, "100% fee");

    if (SettlementMath::scalarLongWeightBps(250, 0, 400) != 6'250) {
        fail("scalar weight at 250 of 0..400 should be 6250 bps");
    }
    if (SettlementMath::scalarLongWeightBps(-5, 0, 400) != 0 || SettlementMath::scalarLongWeightBps(500, 0, 400) != 10'000) {
        fail("scalar weight must clamp to the range");
    }
    if (SettlementMath::scalarLongWeightBps(-100, -200, 0) != 5'000) {
        fail("scalar weight must handle negative ranges");
    }
    expectThrows<std::invalid_argument>([] { SettlementMath::scalarLongWeightBps(1, 5, 5); }, "empty scalar range");

    std::vector<Amount> scalar = SettlementMath::allocateScalar(1'000, 6'250, 10, 10);
    if (scalar.size() != 2 || scalar[0] != 625 || scalar[1] != 375) {
        fail("scalar allocation should split 625/375");
    }
    scalar = SettlementMath::allocateScalar(1'000, 6'250, 0, 10);
    if (scalar[0] != 0 || scalar[1] != 1'000) {
        fail("an unbacked LONG side must cede its share");
    }
    scalar = SettlementMath::allocateScalar(1'000, 6'250, 10, 0);
    if (scalar[0] != 1'000 || scalar[1] != 0) {
        fail("an unbacked SHORT side must cede its share");
    }

    std::vector<Amount> wta = SettlementMath::allocateWinnerTakesAll(3, 1, 500);
    if (wta.size() != 3 || wta[0] != 0 || wta[1] != 500 || wta[2] != 0) {
        fail("winner-takes-all allocation is wrong");
    }
    expectThrows<std::out_of_range>([] { SettlementMath::allocateWinnerTakesAll(2, 2, 1); }, "winner out of range");

    std::cout << "Settlement math checks passed.\n";
    return 0;
}
