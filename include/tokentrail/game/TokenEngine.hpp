#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "tokentrail/game/WorldSettings.hpp"
#include "tokentrail/grid/GridTypes.hpp"
#include "tokentrail/world/CellStore.hpp"

namespace tokentrail {

enum class InteractionKind : std::uint8_t { Collect, Double };

enum class InteractionStatus : std::uint8_t {
    Ok = 0,

    // Gameplay rejections: normal outcomes, nothing changes.
    TooFar,
    NothingToCollect,
    NoTokenHeld,
    NothingToDouble,
    ValueMismatch,
    ValueTooLarge,    // doubling would overflow the token value

    // Precondition violation: the coordinate has no live cell.
    NotLive,
};

[[nodiscard]] const char* StatusName(InteractionStatus s) noexcept;

[[nodiscard]] constexpr bool IsPreconditionViolation(InteractionStatus s) noexcept
{
    return s == InteractionStatus::NotLive;
}

// Largest token value that can still be doubled.
inline constexpr int kMaxDoublableValue = std::numeric_limits<int>::max() / 2;

struct InteractionResult {
    InteractionKind   kind   = InteractionKind::Collect;
    InteractionStatus status = InteractionStatus::Ok;
    GridCoord         coord{};
    double            distanceMeters = 0.0;
    std::optional<int> cellValue;   // target cell's value before the attempt
    std::optional<int> heldValue;   // player's held value before the attempt
    std::optional<int> newValue;    // Collect: value now held; Double: the doubled cell value

    [[nodiscard]] bool Ok() const noexcept { return status == InteractionStatus::Ok; }
};

// One-line status text for the HUD ("Too far! (212m)", "Holding: ...").
[[nodiscard]] std::string DescribeResult(const InteractionResult& r);

// Collect / double / return-to-source rules for the player's single held token.
class TokenEngine {
public:
    TokenEngine(CellStore& cells, PlayerState& player, const WorldSettings& settings) noexcept
        : m_cells(cells), m_player(player), m_settings(settings) {}

    // Dry runs: what an attempt would do right now. Never mutate.
    [[nodiscard]] InteractionResult EvaluateCollect(const GridCoord& c) const;
    [[nodiscard]] InteractionResult EvaluateDouble(const GridCoord& c) const;

    InteractionResult Collect(const GridCoord& c);
    InteractionResult Double(const GridCoord& c);

    [[nodiscard]] double DistanceTo(const GridCoord& c) const noexcept;

private:
    CellStore& m_cells;
    PlayerState& m_player;
    const WorldSettings& m_settings;
};

} // namespace tokentrail
