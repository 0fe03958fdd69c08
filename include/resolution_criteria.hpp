#pragma once

#include "weather_report.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wx {

enum class CriteriaKind : std::uint8_t { Manual, Binary, Bracket, Scalar };

enum class Comparison : std::uint8_t { Greater, GreaterEqual, Less, LessEqual, Equal };

const char* criteriaKindName(CriteriaKind kind);

// Half-open [lower, upper). A missing bound is unbounded; lower == upper
// matches that single value.
struct BracketRange {
    std::optional<std::int64_t> lower;
    std::optional<std::int64_t> upper;

    bool contains(std::int64_t value) const;
};

// Parsed form of a market's resolution criteria string:
//   manual
//   binary:<field>:<gt|gte|lt|lte|eq>:<threshold>   or   <field> <op> <threshold>
//   bracket:<field>:<lo>:<hi>,<lo>:<hi>,...         (-inf / inf allowed)
//   scalar:<field>:<min>:<max>
// Values are in the reading's instrument units.
struct ResolutionCriteria {
    CriteriaKind kind = CriteriaKind::Manual;
    ReadingField field = ReadingField::Temperature;
    Comparison comparison = Comparison::Greater;
    std::int64_t threshold = 0;
    std::vector<BracketRange> brackets;
    std::int64_t rangeMin = 0;
    std::int64_t rangeMax = 0;

    static ResolutionCriteria parse(const std::string& text);

    std::int64_t observe(const WeatherReading& reading) const { return readField(reading, field); }
    bool evaluateBinary(std::int64_t value) const;
    // First bracket containing the value; throws ValidationError when none does.
    std::size_t bracketFor(std::int64_t value) const;
};

} // namespace wx
