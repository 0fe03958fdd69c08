#include "errors.hpp"
#include "resolution_criteria.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "resolution_criteria_test failure: " << msg << std::endl;
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

void expectRejected(const std::string& criteria) {
    expectThrows<wx::ValidationError>([&] { (void)wx::ResolutionCriteria::parse(criteria); }, "'" + criteria + "'");
}

void binaryForms() {
    using namespace wx;
    const ResolutionCriteria shorthand = ResolutionCriteria::parse("temp < 250");
    if (shorthand.kind != CriteriaKind::Binary || shorthand.comparison != Comparison::Less ||
        shorthand.threshold != 250 || shorthand.field != ReadingField::Temperature) {
        fail("shorthand should parse as a binary comparison");
    }
    if (!shorthand.evaluateBinary(249) || shorthand.evaluateBinary(250)) {
        fail("lt is strict");
    }

    const ResolutionCriteria full = ResolutionCriteria::parse("binary:precipitation:gte:5");
    if (full.field != ReadingField::Precipitation || !full.evaluateBinary(5) || full.evaluateBinary(4)) {
        fail("gte includes the threshold");
    }
    if (ResolutionCriteria::parse("manual").kind != CriteriaKind::Manual ||
        ResolutionCriteria::parse("").kind != CriteriaKind::Manual) {
        fail("empty and manual criteria resolve by hand");
    }
    expectThrows<ValidationError>([&] { (void)ResolutionCriteria::parse("manual").evaluateBinary(1); },
                                  "binary evaluation of manual criteria");

    expectRejected("temp ~ 250");
    expectRejected("temp < 250 extra");
    expectRejected("binary:dewpoint:gt:10");
    expectRejected("binary:temp:gt");
    expectRejected("binary:temp:gt:25.5");
    expectRejected("lottery:temp:1:2");
}

void bracketForms() {
    using namespace wx;
    const ResolutionCriteria tiers = ResolutionCriteria::parse("bracket:temp:-inf:200,200:250,250:inf");
    if (tiers.kind != CriteriaKind::Bracket || tiers.brackets.size() != 3) {
        fail("three tiers expected");
    }
    if (tiers.bracketFor(199) != 0 || tiers.bracketFor(200) != 1 || tiers.bracketFor(249) != 1 ||
        tiers.bracketFor(250) != 2 || tiers.bracketFor(-1'000) != 0) {
        fail("brackets are half-open on the upper bound");
    }

    const ResolutionCriteria points = ResolutionCriteria::parse("bracket:humidity:0:50,50:50,51:101");
    if (points.bracketFor(50) != 1 || points.bracketFor(49) != 0 || points.bracketFor(51) != 2) {
        fail("a point bracket owns exactly its value");
    }
    expectThrows<ValidationError>([&] { (void)points.bracketFor(101); }, "value past the last bracket");

    const ResolutionCriteria gapped = ResolutionCriteria::parse("bracket:temp:0:100,200:300");
    expectThrows<ValidationError>([&] { (void)gapped.bracketFor(150); }, "value inside a gap");

    expectRejected("bracket:temp:0:300,200:400");
    expectRejected("bracket:temp:0:inf,100:200");
    expectRejected("bracket:temp:0:100,-inf:50");
    expectRejected("bracket:temp:100:200,0:100");
    expectRejected("bracket:temp:5:5,5:10");
    expectRejected("bracket:temp:300:200,400:500");
    expectRejected("bracket:temp:0:100");
    expectRejected("bracket:temp:0-100,100:200");
}

void scalarForms() {
    using namespace wx;
    const ResolutionCriteria range = ResolutionCriteria::parse("scalar:temp_high:-100:400");
    if (range.kind != CriteriaKind::Scalar || range.field != ReadingField::TemperatureMax || range.rangeMin != -100 ||
        range.rangeMax != 400) {
        fail("scalar range should parse both ends");
    }
    expectRejected("scalar:temp:400:400");
    expectRejected("scalar:temp:0");
}

} // namespace

int main() {
    binaryForms();
    bracketForms();
    scalarForms();
    std::cout << "Resolution criteria checks passed.\n";
    return 0;
}
