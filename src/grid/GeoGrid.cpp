#include "tokentrail/grid/GeoGrid.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace tokentrail {

namespace {

[[nodiscard]] inline double ToRadians(double deg) noexcept
{
    return deg * (std::numbers::pi / 180.0);
}

// floor() that treats values a rounding error below an integer as that integer,
// so stepping exactly one cell from a boundary lands in the next cell.
// Non-finite input maps to 0; everything else is clamped to +/- kMaxCellIndex.
[[nodiscard]] inline int SnapFloor(double x) noexcept
{
    if (!std::isfinite(x))
        return 0;
    x = std::clamp(x, -static_cast<double>(kMaxCellIndex), static_cast<double>(kMaxCellIndex));

    const double r = std::round(x);
    if (std::abs(x - r) < 1e-9)
        return static_cast<int>(r);
    return static_cast<int>(std::floor(x));
}

} // namespace

bool IsValidPosition(const LatLng& p) noexcept
{
    return std::isfinite(p.lat) && std::isfinite(p.lng) &&
           p.lat >= -90.0 && p.lat <= 90.0 && p.lng >= -180.0 && p.lng <= 180.0;
}

GridCoord GridGeometry::CellOf(const LatLng& p) const noexcept
{
    const int ci = SnapFloor((p.lat - origin.lat) / cellDegrees);
    const int cj = SnapFloor((p.lng - origin.lng) / cellDegrees);
    return GridCoord{ ci, cj };
}

LatLng GridGeometry::CellCorner(const GridCoord& c) const noexcept
{
    return LatLng{ origin.lat + c.i * cellDegrees, origin.lng + c.j * cellDegrees };
}

LatLng GridGeometry::CellCenter(const GridCoord& c) const noexcept
{
    return LatLng{ origin.lat + (c.i + 0.5) * cellDegrees, origin.lng + (c.j + 0.5) * cellDegrees };
}

CellRect GridGeometry::ViewWindow(const LatLng& p, int radiusCells) const noexcept
{
    const int r = std::clamp(radiusCells, 0, kMaxViewRadius);
    const GridCoord center = CellOf(p);
    return CellRect{ { center.i - r, center.j - r }, { center.i + r, center.j + r } };
}

double DistanceMeters(const LatLng& a, const LatLng& b) noexcept
{
    const double lat1 = ToRadians(a.lat);
    const double lat2 = ToRadians(b.lat);
    const double dLat = lat2 - lat1;
    const double dLng = ToRadians(b.lng - a.lng);

    const double s1 = std::sin(dLat * 0.5);
    const double s2 = std::sin(dLng * 0.5);
    const double h = s1 * s1 + std::cos(lat1) * std::cos(lat2) * s2 * s2;

    // Clamp against rounding pushing h slightly past 1 for antipodal points.
    return 2.0 * kEarthRadiusMeters * std::asin(std::sqrt(std::min(1.0, h)));
}

} // namespace tokentrail
