#include "weather_report.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace wx {

namespace {

constexpr std::array<std::pair<const char*, WeatherCondition>, 6> kConditions{ {
    { "clear", WeatherCondition::Clear },
    { "cloudy", WeatherCondition::Cloudy },
    { "rain", WeatherCondition::Rain },
    { "snow", WeatherCondition::Snow },
    { "fog", WeatherCondition::Fog },
    { "storm", WeatherCondition::Storm },
} };

// Aliases follow the resolution types the market generator encodes.
constexpr std::array<std::pair<const char*, ReadingField>, 14> kFields{ {
    { "temperature", ReadingField::Temperature },
    { "temp", ReadingField::Temperature },
    { "temperature_max", ReadingField::TemperatureMax },
    { "temp_high", ReadingField::TemperatureMax },
    { "temperature_min", ReadingField::TemperatureMin },
    { "temp_low", ReadingField::TemperatureMin },
    { "precipitation", ReadingField::Precipitation },
    { "visibility", ReadingField::Visibility },
    { "wind_speed", ReadingField::WindSpeed },
    { "wind_gust", ReadingField::WindGust },
    { "pressure", ReadingField::Pressure },
    { "humidity", ReadingField::Humidity },
    { "conditions", ReadingField::Conditions },
    { "condition", ReadingField::Conditions },
} };

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

} // namespace

const char* conditionName(WeatherCondition condition) {
    for (const auto& entry : kConditions) {
        if (entry.second == condition) {
            return entry.first;
        }
    }
    return "unknown";
}

std::optional<WeatherCondition> parseCondition(const std::string& text) {
    if (text.size() == 1 && text[0] >= '0' && text[0] <= '5') {
        return static_cast<WeatherCondition>(text[0] - '0');
    }
    const std::string lowered = lowercase(text);
    for (const auto& entry : kConditions) {
        if (lowered == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

const char* fieldName(ReadingField field) {
    for (const auto& entry : kFields) {
        if (entry.second == field) {
            return entry.first;
        }
    }
    return "unknown";
}

std::optional<ReadingField> parseReadingField(const std::string& text) {
    const std::string lowered = lowercase(text);
    for (const auto& entry : kFields) {
        if (lowered == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::int64_t readField(const WeatherReading& reading, ReadingField field) {
    switch (field) {
    case ReadingField::Temperature:
        return reading.temperature;
    case ReadingField::TemperatureMax:
        return reading.temperatureMax;
    case ReadingField::TemperatureMin:
        return reading.temperatureMin;
    case ReadingField::Precipitation:
        return reading.precipitation;
    case ReadingField::Visibility:
        return reading.visibility;
    case ReadingField::WindSpeed:
        return reading.windSpeed;
    case ReadingField::WindGust:
        return reading.windGust;
    case ReadingField::Pressure:
        return reading.pressure;
    case ReadingField::Humidity:
        return reading.humidity;
    case ReadingField::Conditions:
        return static_cast<std::int64_t>(reading.conditions);
    }
    return 0;
}

} // namespace wx
