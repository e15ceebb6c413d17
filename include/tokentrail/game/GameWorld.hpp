#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "tokentrail/game/Movement.hpp"
#include "tokentrail/game/TokenEngine.hpp"
#include "tokentrail/game/ViewManager.hpp"
#include "tokentrail/game/WorldSettings.hpp"
#include "tokentrail/world/CellGenerator.hpp"
#include "tokentrail/world/CellRenderer.hpp"
#include "tokentrail/world/CellStore.hpp"
#include "tokentrail/world/HighestValue.hpp"
#include "tokentrail/world/MutationLedger.hpp"

namespace tokentrail {

// The whole game state in one place: ledger, live cells, player, held token,
// highest value. Every inbound event goes through here.
class GameWorld {
public:
    GameWorld(const WorldSettings& settings, ICellRenderer& renderer, IScoreListener& score);

    // Uses `luck` instead of the seeded hash. `luck` must outlive the world.
    GameWorld(const WorldSettings& settings, const ICellLuck& luck,
              ICellRenderer& renderer, IScoreListener& score);

    GameWorld(const GameWorld&) = delete;
    GameWorld& operator=(const GameWorld&) = delete;

    // Inbound events ----------------------------------------------------------
    // Positions that fail IsValidPosition are ignored and return an empty diff.
    ViewDiff OnPlayerMoved(const LatLng& position);
    ViewDiff MovePlayer(MoveDirection dir);

    InteractionResult AttemptCollect(const GridCoord& c) { return m_tokens.Collect(c); }
    InteractionResult AttemptDouble(const GridCoord& c) { return m_tokens.Double(c); }

    // Fresh start: empty ledger, nothing held, record cleared, player at origin.
    void Reset();

    // Persistence -------------------------------------------------------------
    [[nodiscard]] nlohmann::json ExportState() const;

    // All-or-nothing. On failure the world is Reset() and false is returned.
    bool ImportState(const nlohmann::json& j, std::string* outError);

    bool SaveJson(const std::filesystem::path& path, std::string* outError = nullptr) const noexcept;
    bool LoadJson(const std::filesystem::path& path, std::string* outError = nullptr) noexcept;

    // Accessors ---------------------------------------------------------------
    [[nodiscard]] const WorldSettings&      Settings() const noexcept { return m_settings; }
    [[nodiscard]] const PlayerState&        Player() const noexcept { return m_player; }
    [[nodiscard]] const MutationLedger&     Ledger() const noexcept { return m_ledger; }
    [[nodiscard]] const CellStore&          Cells() const noexcept { return m_cells; }
    [[nodiscard]] const HighestValueRecord& Highest() const noexcept { return m_highest; }
    [[nodiscard]] const CellGenerator&      Generator() const noexcept { return m_generator; }
    [[nodiscard]] const TokenEngine&        Tokens() const noexcept { return m_tokens; }
    [[nodiscard]] const ViewManager&        View() const noexcept { return m_view; }
    [[nodiscard]] GridCoord                 PlayerCell() const noexcept { return m_settings.geometry.CellOf(m_player.position); }

private:
    WorldSettings                m_settings;
    std::unique_ptr<ICellLuck>   m_ownedLuck;
    const ICellLuck&             m_luck;
    CellGenerator                m_generator;
    MutationLedger               m_ledger;
    HighestValueRecord           m_highest;
    CellStore                    m_cells;
    PlayerState                  m_player;
    TokenEngine                  m_tokens;
    ViewManager                  m_view;
};

} // namespace tokentrail
