#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

namespace tokentrail {

// Integer lattice coordinate. i = latitude index, j = longitude index.
struct GridCoord {
    std::int32_t i = 0;
    std::int32_t j = 0;
    bool operator==(const GridCoord& o) const noexcept { return i == o.i && j == o.j; }
    bool operator!=(const GridCoord& o) const noexcept { return !(*this == o); }
};

struct GridCoordHasher {
    std::size_t operator()(const GridCoord& k) const noexcept {
        const std::uint64_t a = static_cast<std::uint32_t>(k.i);
        const std::uint64_t b = static_cast<std::uint32_t>(k.j);
        return static_cast<std::size_t>((a * 11400714819323198485ull) ^ (b << 1) ^ (b >> 7));
    }
};

// Real-valued player position in degrees.
struct LatLng {
    double lat = 0.0;
    double lng = 0.0;
    bool operator==(const LatLng& o) const noexcept { return lat == o.lat && lng == o.lng; }
};

// Inclusive rectangle of grid coordinates.
struct CellRect {
    GridCoord min;
    GridCoord max;

    [[nodiscard]] bool Contains(const GridCoord& c) const noexcept {
        return c.i >= min.i && c.i <= max.i && c.j >= min.j && c.j <= max.j;
    }

    [[nodiscard]] std::size_t CellCount() const noexcept {
        if (max.i < min.i || max.j < min.j) return 0;
        return static_cast<std::size_t>(max.i - min.i + 1) * static_cast<std::size_t>(max.j - min.j + 1);
    }
};

} // namespace tokentrail
