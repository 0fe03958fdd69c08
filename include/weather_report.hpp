#pragma once

#include "ledger_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace wx {

enum class WeatherCondition : std::uint8_t {
    Clear = 0,
    Cloudy = 1,
    Rain = 2,
    Snow = 3,
    Fog = 4,
    Storm = 5
};

const char* conditionName(WeatherCondition condition);
std::optional<WeatherCondition> parseCondition(const std::string& text);

// Instrument units: temperatures in Celsius x10, precipitation in mm x10,
// visibility in metres, wind in knots x10, pressure in hPa, humidity in %.
struct WeatherReading {
    std::int64_t temperature = 0;
    std::int64_t temperatureMax = 0;
    std::int64_t temperatureMin = 0;
    std::int64_t precipitation = 0;
    std::int64_t visibility = 0;
    std::int64_t windSpeed = 0;
    std::int64_t windGust = 0;
    std::int64_t pressure = 0;
    std::int64_t humidity = 0;
    WeatherCondition conditions = WeatherCondition::Clear;
    std::string sourceHash;
};

enum class ReadingField : std::uint8_t {
    Temperature,
    TemperatureMax,
    TemperatureMin,
    Precipitation,
    Visibility,
    WindSpeed,
    WindGust,
    Pressure,
    Humidity,
    Conditions
};

const char* fieldName(ReadingField field);
std::optional<ReadingField> parseReadingField(const std::string& text);
std::int64_t readField(const WeatherReading& reading, ReadingField field);

struct ReportSubmission {
    WeatherReading reading;
    Timestamp submittedAt = 0;
};

struct WeatherReport {
    ReportKey key;
    // Ordered by reporter so aggregation is independent of arrival order.
    std::map<Identity, ReportSubmission> submissions;
    bool finalized = false;
    WeatherReading aggregate;
    Timestamp finalizedAt = 0;
    std::uint32_t revision = 0;
    bool corrected = false;
    // Ruling the arbitrator stated; kept for the record only. Markets judge
    // the corrected aggregate with their own criteria.
    std::optional<bool> correctedOutcome;
};

// What a market reads at settlement time.
struct ReportSnapshot {
    ReportKey key;
    bool finalized = false;
    bool disputeActive = false;
    WeatherReading aggregate;
    std::uint32_t revision = 0;
};

} // namespace wx
