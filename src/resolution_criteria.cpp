#include "resolution_criteria.hpp"

#include "errors.hpp"

#include <sstream>
#include <stdexcept>

namespace wx {

namespace {

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(text);
    while (std::getline(stream, current, delimiter)) {
        parts.push_back(current);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.emplace_back();
    }
    return parts;
}

std::int64_t parseValue(const std::string& text, const std::string& criteria) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed, 10);
    } catch (const std::invalid_argument&) {
        throw ValidationError("bad number '" + text + "' in criteria '" + criteria + "'");
    } catch (const std::out_of_range&) {
        throw ValidationError("number '" + text + "' out of range in criteria '" + criteria + "'");
    }
    if (consumed != text.size()) {
        throw ValidationError("bad number '" + text + "' in criteria '" + criteria + "'");
    }
    return static_cast<std::int64_t>(value);
}

std::optional<std::int64_t> parseBound(const std::string& text, bool lower, const std::string& criteria) {
    if ((lower && text == "-inf") || (!lower && text == "inf")) {
        return std::nullopt;
    }
    return parseValue(text, criteria);
}

ReadingField requireField(const std::string& text, const std::string& criteria) {
    auto field = parseReadingField(text);
    if (!field) {
        throw ValidationError("unknown field '" + text + "' in criteria '" + criteria + "'");
    }
    return *field;
}

std::optional<Comparison> parseComparison(const std::string& text) {
    if (text == "gt" || text == ">") {
        return Comparison::Greater;
    }
    if (text == "gte" || text == ">=") {
        return Comparison::GreaterEqual;
    }
    if (text == "lt" || text == "<") {
        return Comparison::Less;
    }
    if (text == "lte" || text == "<=") {
        return Comparison::LessEqual;
    }
    if (text == "eq" || text == "==") {
        return Comparison::Equal;
    }
    return std::nullopt;
}

ResolutionCriteria parseBinary(ReadingField field,
                               const std::string& op,
                               const std::string& threshold,
                               const std::string& criteria) {
    auto comparison = parseComparison(op);
    if (!comparison) {
        throw ValidationError("unknown comparison '" + op + "' in criteria '" + criteria + "'");
    }
    ResolutionCriteria out;
    out.kind = CriteriaKind::Binary;
    out.field = field;
    out.comparison = *comparison;
    out.threshold = parseValue(threshold, criteria);
    return out;
}

} // namespace

const char* criteriaKindName(CriteriaKind kind) {
    switch (kind) {
    case CriteriaKind::Manual:
        return "manual";
    case CriteriaKind::Binary:
        return "binary";
    case CriteriaKind::Bracket:
        return "bracket";
    case CriteriaKind::Scalar:
        return "scalar";
    }
    return "unknown";
}

bool BracketRange::contains(std::int64_t value) const {
    if (lower && upper && *lower == *upper) {
        return value == *lower;
    }
    if (lower && value < *lower) {
        return false;
    }
    if (upper && value >= *upper) {
        return false;
    }
    return true;
}

ResolutionCriteria ResolutionCriteria::parse(const std::string& text) {
    if (text.empty() || text == "manual") {
        return {};
    }

    // Generator shorthand: "<field> <op> <threshold>".
    if (text.find(':') == std::string::npos) {
        std::istringstream stream(text);
        std::string field;
        std::string op;
        std::string threshold;
        std::string extra;
        if (!(stream >> field >> op >> threshold) || (stream >> extra)) {
            throw ValidationError("unrecognised criteria '" + text + "'");
        }
        return parseBinary(requireField(field, text), op, threshold, text);
    }

    auto head = split(text, ':');
    if (head.size() < 3) {
        throw ValidationError("unrecognised criteria '" + text + "'");
    }
    const std::string& kind = head[0];
    ReadingField field = requireField(head[1], text);

    if (kind == "binary") {
        if (head.size() != 4) {
            throw ValidationError("binary criteria needs field, comparison and threshold: '" + text + "'");
        }
        return parseBinary(field, head[2], head[3], text);
    }

    if (kind == "scalar") {
        if (head.size() != 4) {
            throw ValidationError("scalar criteria needs field, min and max: '" + text + "'");
        }
        ResolutionCriteria out;
        out.kind = CriteriaKind::Scalar;
        out.field = field;
        out.rangeMin = parseValue(head[2], text);
        out.rangeMax = parseValue(head[3], text);
        if (out.rangeMax <= out.rangeMin) {
            throw ValidationError("scalar range must have max > min: '" + text + "'");
        }
        return out;
    }

    if (kind == "bracket") {
        const std::size_t prefix = head[0].size() + head[1].size() + 2;
        ResolutionCriteria out;
        out.kind = CriteriaKind::Bracket;
        out.field = field;
        for (const auto& range : split(text.substr(prefix), ',')) {
            auto bounds = split(range, ':');
            if (bounds.size() != 2) {
                throw ValidationError("bracket '" + range + "' must be <lo>:<hi> in '" + text + "'");
            }
            BracketRange bracket{ parseBound(bounds[0], true, text), parseBound(bounds[1], false, text) };
            if (bracket.lower && bracket.upper && *bracket.upper < *bracket.lower) {
                throw ValidationError("bracket '" + range + "' has upper below lower in '" + text + "'");
            }
            if (!out.brackets.empty()) {
                // Each bracket starts at or after the previous one ends; a point
                // bracket also owns its upper bound.
                const BracketRange& previous = out.brackets.back();
                const bool pointBefore = previous.lower && previous.upper && *previous.lower == *previous.upper;
                if (!previous.upper || !bracket.lower || *bracket.lower < *previous.upper ||
                    (pointBefore && *bracket.lower == *previous.upper)) {
                    throw ValidationError("brackets must be ascending and must not overlap in '" + text + "'");
                }
            }
            out.brackets.push_back(bracket);
        }
        if (out.brackets.size() < 2) {
            throw ValidationError("bracket criteria needs at least two brackets: '" + text + "'");
        }
        return out;
    }

    throw ValidationError("unknown criteria kind '" + kind + "'");
}

bool ResolutionCriteria::evaluateBinary(std::int64_t value) const {
    if (kind != CriteriaKind::Binary) {
        throw ValidationError(std::string("criteria is ") + criteriaKindName(kind) + ", not binary");
    }
    switch (comparison) {
    case Comparison::Greater:
        return value > threshold;
    case Comparison::GreaterEqual:
        return value >= threshold;
    case Comparison::Less:
        return value < threshold;
    case Comparison::LessEqual:
        return value <= threshold;
    case Comparison::Equal:
        return value == threshold;
    }
    return false;
}

std::size_t ResolutionCriteria::bracketFor(std::int64_t value) const {
    for (std::size_t i = 0; i < brackets.size(); ++i) {
        if (brackets[i].contains(value)) {
            return i;
        }
    }
    throw ValidationError("value " + std::to_string(value) + " falls outside every bracket");
}

} // namespace wx
