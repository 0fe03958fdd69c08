#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace wx {

using Identity = std::string;
using Amount = std::uint64_t;
using Timestamp = std::uint64_t;

// Base units per whole unit of collateral (nano-denominated).
constexpr Amount kUnit = 1'000'000'000;
constexpr std::uint32_t kBasisPoints = 10'000;
constexpr Timestamp kSecondsPerDay = 86'400;

enum class Side : std::uint8_t { Yes = 0, No = 1 };

inline const char* sideName(Side side) {
    return side == Side::Yes ? "yes" : "no";
}

struct ReportKey {
    std::uint64_t locationId = 0;
    std::uint64_t dateKey = 0;

    bool operator==(const ReportKey& other) const {
        return locationId == other.locationId && dateKey == other.dateKey;
    }
    bool operator!=(const ReportKey& other) const { return !(*this == other); }
    bool operator<(const ReportKey& other) const {
        if (locationId != other.locationId) {
            return locationId < other.locationId;
        }
        return dateKey < other.dateKey;
    }

    std::string describe() const {
        return std::to_string(locationId) + "/" + std::to_string(dateKey);
    }
};

struct ReportKeyHash {
    std::size_t operator()(const ReportKey& key) const noexcept {
        std::size_t seed = std::hash<std::uint64_t>{}(key.locationId);
        seed ^= std::hash<std::uint64_t>{}(key.dateKey) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

inline std::uint64_t dateKeyFor(Timestamp timestamp) {
    return timestamp / kSecondsPerDay;
}

} // namespace wx
