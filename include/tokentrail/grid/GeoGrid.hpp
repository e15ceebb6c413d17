#pragma once
#include "tokentrail/grid/GridTypes.hpp"

namespace tokentrail {

inline constexpr double kCellDegrees      = 1e-4;
inline constexpr double kEarthRadiusMeters = 6371000.0;
inline constexpr LatLng kDefaultOrigin{ 36.997936938057016, -122.05703507501151 };

// Cell indices and window radii are clamped to these so window corners stay in int range.
inline constexpr int kMaxCellIndex  = 1 << 30;
inline constexpr int kMaxViewRadius = 1 << 20;

// Finite and on the globe: |lat| <= 90, |lng| <= 180.
[[nodiscard]] bool IsValidPosition(const LatLng& p) noexcept;

// Maps between continuous lat/lng and the integer cell lattice.
// Cell (0,0) has its south-west corner at `origin`.
struct GridGeometry {
    LatLng origin = kDefaultOrigin;
    double cellDegrees = kCellDegrees;

    [[nodiscard]] GridCoord CellOf(const LatLng& p) const noexcept;
    [[nodiscard]] LatLng CellCorner(const GridCoord& c) const noexcept;
    [[nodiscard]] LatLng CellCenter(const GridCoord& c) const noexcept;

    // Inclusive window of +/- radiusCells around the cell containing `p`.
    [[nodiscard]] CellRect ViewWindow(const LatLng& p, int radiusCells) const noexcept;
};

// Great-circle distance in meters (haversine on a sphere).
[[nodiscard]] double DistanceMeters(const LatLng& a, const LatLng& b) noexcept;

} // namespace tokentrail
