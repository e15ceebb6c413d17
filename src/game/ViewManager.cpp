#include "tokentrail/game/ViewManager.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#ifdef TRACY_ENABLE
  #include <tracy/Tracy.hpp>
  #define TOKENTRAIL_TRACY_ZONE(name_literal) ZoneScopedN(name_literal)
#else
  #define TOKENTRAIL_TRACY_ZONE(name_literal)
#endif

namespace tokentrail {

ViewDiff ViewManager::OnPlayerMoved(const LatLng& position)
{
    TOKENTRAIL_TRACY_ZONE("ViewManager::OnPlayerMoved");

    m_player.position = position;
    const GridCoord center = m_settings.geometry.CellOf(position);
    const CellRect next = m_settings.geometry.ViewWindow(position, m_settings.viewRadiusCells);

    ViewDiff diff;

    if (m_window && m_window->min == next.min && m_window->max == next.max) {
        diff.kept = m_cells.LiveCount();
        m_renderer.OnPlayerMoved(position, center);
        return diff;
    }

    // Evict first so the store never holds more than one window's worth.
    std::vector<GridCoord> leaving;
    for (const GridCoord& c : m_cells.LiveCoords()) {
        if (!next.Contains(c))
            leaving.push_back(c);
    }
    for (const GridCoord& c : leaving)
        m_cells.Evict(c);
    diff.removed = leaving.size();

    for (int i = next.min.i; i <= next.max.i; ++i) {
        for (int j = next.min.j; j <= next.max.j; ++j) {
            const GridCoord c{ i, j };
            if (m_cells.IsLive(c)) {
                ++diff.kept;
                continue;
            }
            m_cells.Materialize(c);
            ++diff.added;
        }
    }

    m_window = next;
    m_renderer.OnPlayerMoved(position, center);

    spdlog::debug("View at [{}, {}]: +{} -{} ={}", center.i, center.j, diff.added, diff.removed, diff.kept);
    return diff;
}

} // namespace tokentrail
