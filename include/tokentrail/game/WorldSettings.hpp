#pragma once
#include <cstdint>
#include <optional>

#include "tokentrail/grid/GeoGrid.hpp"
#include "tokentrail/grid/GridTypes.hpp"
#include "tokentrail/world/HighestValue.hpp"

namespace tokentrail {

namespace core { struct Config; }

inline constexpr int    kDefaultViewRadiusCells  = 24;
inline constexpr double kCollectionRadiusMeters  = 50.0;

struct WorldSettings {
    GridGeometry  geometry{};
    int           viewRadiusCells        = kDefaultViewRadiusCells;
    double        collectionRadiusMeters = kCollectionRadiusMeters;
    int           winThreshold           = kWinThreshold;
    std::uint64_t worldSeed              = 0;
};

[[nodiscard]] WorldSettings SettingsFromConfig(const core::Config& cfg) noexcept;

// The single token the player may carry, and the cell it was lifted from.
struct PlayerToken {
    int       value = 0;
    GridCoord origin{};
    bool operator==(const PlayerToken& o) const noexcept { return value == o.value && origin == o.origin; }
};

struct PlayerState {
    LatLng                     position = kDefaultOrigin;
    std::optional<PlayerToken> held;
};

} // namespace tokentrail
