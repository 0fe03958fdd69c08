#include "aggregator.hpp"

#include "audit_journal.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace wx {

namespace {

std::vector<std::int64_t> collect(const std::vector<const ReportSubmission*>& submissions,
                                  ReadingField field) {
    std::vector<std::int64_t> values;
    values.reserve(submissions.size());
    for (const auto* submission : submissions) {
        values.push_back(readField(submission->reading, field));
    }
    return values;
}

WeatherCondition modeCondition(const std::vector<const ReportSubmission*>& submissions) {
    std::array<std::size_t, 6> counts{};
    for (const auto* submission : submissions) {
        counts[static_cast<std::size_t>(submission->reading.conditions)]++;
    }
    std::size_t best = 0;
    for (std::size_t i = 1; i < counts.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }
    return static_cast<WeatherCondition>(best);
}

std::string combineSourceHashes(const std::vector<const ReportSubmission*>& submissions) {
    std::vector<std::string> hashes;
    hashes.reserve(submissions.size());
    for (const auto* submission : submissions) {
        hashes.push_back(submission->reading.sourceHash);
    }
    std::sort(hashes.begin(), hashes.end());
    std::string joined;
    for (std::size_t i = 0; i < hashes.size(); ++i) {
        if (i != 0) {
            joined.push_back('|');
        }
        joined += hashes[i];
    }
    return sha256Hex(joined);
}

} // namespace

WeatherAggregator::WeatherAggregator(std::int64_t temperatureTolerance, std::uint32_t minReports)
    : tolerance_(temperatureTolerance)
    , minReports_(minReports) {
    if (tolerance_ < 0) {
        throw std::invalid_argument("temperature tolerance must not be negative");
    }
    if (minReports_ < 2) {
        throw std::invalid_argument("consensus needs at least two reporters");
    }
}

bool WeatherAggregator::submit(const Identity& reporter,
                               const ReportKey& key,
                               const WeatherReading& reading,
                               Timestamp now,
                               const ActivePredicate& isActive) {
    auto it = reports_.find(key);
    if (it != reports_.end() && it->second.finalized) {
        throw StateError("report " + key.describe() + " is already finalized");
    }

    WeatherReport next;
    if (it != reports_.end()) {
        next = it->second;
    } else {
        next.key = key;
    }
    next.submissions[reporter] = ReportSubmission{ reading, now };

    std::vector<const ReportSubmission*> counted;
    for (const auto& [id, submission] : next.submissions) {
        if (isActive(id)) {
            counted.push_back(&submission);
        }
    }

    bool finalizedNow = false;
    if (counted.size() >= minReports_ && withinTolerance(counted, tolerance_)) {
        next.aggregate = aggregate(counted);
        next.finalized = true;
        next.finalizedAt = now;
        next.revision = 1;
        finalizedNow = true;
    }

    reports_[key] = std::move(next);
    return finalizedNow;
}

void WeatherAggregator::applyCorrection(const ReportKey& key, std::int64_t newValue, bool newOutcome) {
    auto it = reports_.find(key);
    if (it == reports_.end() || !it->second.finalized) {
        throw StateError("report " + key.describe() + " is not finalized");
    }
    it->second.aggregate.temperature = newValue;
    it->second.correctedOutcome = newOutcome;
    it->second.corrected = true;
    it->second.revision++;
}

bool WeatherAggregator::isFinalized(const ReportKey& key) const {
    auto it = reports_.find(key);
    return it != reports_.end() && it->second.finalized;
}

const WeatherReport* WeatherAggregator::find(const ReportKey& key) const {
    auto it = reports_.find(key);
    if (it == reports_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool WeatherAggregator::withinTolerance(const std::vector<const ReportSubmission*>& submissions,
                                        std::int64_t tolerance) {
    if (submissions.size() < 2) {
        return false;
    }
    auto temps = collect(submissions, ReadingField::Temperature);
    auto [lo, hi] = std::minmax_element(temps.begin(), temps.end());
    __int128 spread = static_cast<__int128>(*hi) - static_cast<__int128>(*lo);
    return spread <= static_cast<__int128>(tolerance);
}

std::int64_t WeatherAggregator::roundedMean(const std::vector<std::int64_t>& values) {
    if (values.empty()) {
        throw std::invalid_argument("mean of an empty set");
    }
    __int128 sum = 0;
    for (auto value : values) {
        sum += value;
    }
    const __int128 count = static_cast<__int128>(values.size());
    __int128 quotient = sum / count;
    __int128 remainder = sum % count;
    if (remainder < 0) {
        remainder = -remainder;
    }
    // Half away from zero.
    if (remainder * 2 >= count) {
        quotient += (sum < 0) ? -1 : 1;
    }
    return static_cast<std::int64_t>(quotient);
}

WeatherReading WeatherAggregator::aggregate(const std::vector<const ReportSubmission*>& submissions) {
    if (submissions.empty()) {
        throw std::invalid_argument("cannot aggregate zero readings");
    }
    WeatherReading out;
    out.temperature = roundedMean(collect(submissions, ReadingField::Temperature));
    out.temperatureMax = roundedMean(collect(submissions, ReadingField::TemperatureMax));
    out.temperatureMin = roundedMean(collect(submissions, ReadingField::TemperatureMin));
    out.precipitation = roundedMean(collect(submissions, ReadingField::Precipitation));
    out.visibility = roundedMean(collect(submissions, ReadingField::Visibility));
    out.windSpeed = roundedMean(collect(submissions, ReadingField::WindSpeed));
    out.windGust = roundedMean(collect(submissions, ReadingField::WindGust));
    out.pressure = roundedMean(collect(submissions, ReadingField::Pressure));
    out.humidity = roundedMean(collect(submissions, ReadingField::Humidity));
    out.conditions = modeCondition(submissions);
    out.sourceHash = combineSourceHashes(submissions);
    return out;
}

} // namespace wx
