#pragma once
#include <cstddef>
#include <optional>

#include "tokentrail/game/WorldSettings.hpp"
#include "tokentrail/grid/GridTypes.hpp"
#include "tokentrail/world/CellRenderer.hpp"
#include "tokentrail/world/CellStore.hpp"

namespace tokentrail {

struct ViewDiff {
    std::size_t added   = 0;
    std::size_t removed = 0;
    std::size_t kept    = 0;
};

// Keeps the set of live cells equal to the window around the player.
class ViewManager {
public:
    ViewManager(CellStore& cells, PlayerState& player, const WorldSettings& settings,
                ICellRenderer& renderer) noexcept
        : m_cells(cells), m_player(player), m_settings(settings), m_renderer(renderer) {}

    // Moves the player and reconciles the window. Cells that stay inside the
    // window are left alone; moving within the same cell touches nothing.
    ViewDiff OnPlayerMoved(const LatLng& position);

    // Forget the current window so the next move rebuilds it from scratch.
    void Invalidate() noexcept { m_window.reset(); }

    [[nodiscard]] const std::optional<CellRect>& Window() const noexcept { return m_window; }

private:
    CellStore& m_cells;
    PlayerState& m_player;
    const WorldSettings& m_settings;
    ICellRenderer& m_renderer;

    std::optional<CellRect> m_window;
};

} // namespace tokentrail
