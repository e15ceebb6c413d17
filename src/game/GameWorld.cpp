#include "tokentrail/game/GameWorld.hpp"

#include <spdlog/spdlog.h>

namespace tokentrail {

GameWorld::GameWorld(const WorldSettings& settings, ICellRenderer& renderer, IScoreListener& score)
: m_settings(settings)
, m_ownedLuck(std::make_unique<HashedLuck>(settings.worldSeed))
, m_luck(*m_ownedLuck)
, m_generator(m_luck)
, m_highest(score, settings.winThreshold)
, m_cells(m_ledger, m_generator, m_highest, renderer)
, m_tokens(m_cells, m_player, m_settings)
, m_view(m_cells, m_player, m_settings, renderer)
{
    Reset();
}

GameWorld::GameWorld(const WorldSettings& settings, const ICellLuck& luck,
                     ICellRenderer& renderer, IScoreListener& score)
: m_settings(settings)
, m_luck(luck)
, m_generator(m_luck)
, m_highest(score, settings.winThreshold)
, m_cells(m_ledger, m_generator, m_highest, renderer)
, m_tokens(m_cells, m_player, m_settings)
, m_view(m_cells, m_player, m_settings, renderer)
{
    Reset();
}

ViewDiff GameWorld::OnPlayerMoved(const LatLng& position)
{
    if (!IsValidPosition(position)) {
        spdlog::warn("Ignoring invalid player position ({}, {})", position.lat, position.lng);
        return ViewDiff{};
    }
    return m_view.OnPlayerMoved(position);
}

ViewDiff GameWorld::MovePlayer(MoveDirection dir)
{
    const LatLng next = StepPosition(m_player.position, dir, m_settings.geometry.cellDegrees);
    spdlog::debug("Player steps {}", DirectionName(dir));
    return OnPlayerMoved(next);
}

void GameWorld::Reset()
{
    m_cells.DiscardAll();
    m_ledger.Clear();
    m_highest.Reset();
    m_player.held.reset();
    m_view.Invalidate();
    m_view.OnPlayerMoved(m_settings.geometry.origin);

    spdlog::info("World reset: seed={} origin=({:.6f}, {:.6f}) radius={} cells",
                 m_settings.worldSeed, m_settings.geometry.origin.lat, m_settings.geometry.origin.lng,
                 m_settings.viewRadiusCells);
}

} // namespace tokentrail
