#pragma once

#include "ledger_types.hpp"
#include "weather_report.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

namespace wx {

// Collects per-reporter readings for each (location, date) key and finalizes
// the key once enough active reporters agree on temperature.
class WeatherAggregator {
public:
    using ActivePredicate = std::function<bool(const Identity&)>;

    WeatherAggregator(std::int64_t temperatureTolerance, std::uint32_t minReports);

    // Stores or overwrites the reporter's reading. Returns true when this
    // submission finalized the report.
    bool submit(const Identity& reporter,
                const ReportKey& key,
                const WeatherReading& reading,
                Timestamp now,
                const ActivePredicate& isActive);

    // Dispute path: overwrite the finalized temperature and record the ruling.
    void applyCorrection(const ReportKey& key, std::int64_t newValue, bool newOutcome);

    bool isFinalized(const ReportKey& key) const;
    const WeatherReport* find(const ReportKey& key) const;
    std::size_t size() const { return reports_.size(); }

    static bool withinTolerance(const std::vector<const ReportSubmission*>& submissions,
                                std::int64_t tolerance);
    static WeatherReading aggregate(const std::vector<const ReportSubmission*>& submissions);
    static std::int64_t roundedMean(const std::vector<std::int64_t>& values);

private:
    std::int64_t tolerance_;
    std::uint32_t minReports_;
    std::unordered_map<ReportKey, WeatherReport, ReportKeyHash> reports_;
};

} // namespace wx
