#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

#include "tokentrail/grid/GridTypes.hpp"

namespace tokentrail {

enum class MoveDirection : std::uint8_t {
    North = 0,
    South,
    East,
    West,

    Count
};

[[nodiscard]] const char* DirectionName(MoveDirection d) noexcept;

// Key names as reported by keyboards / on-screen buttons ("ArrowUp", "w", ...)
// and the direction words used by the console ("north", "n").
[[nodiscard]] std::optional<MoveDirection> DirectionFromKey(std::string_view key) noexcept;

// One cell in `d`. North increases latitude, East increases longitude.
[[nodiscard]] LatLng StepPosition(const LatLng& p, MoveDirection d, double cellDegrees) noexcept;

} // namespace tokentrail
