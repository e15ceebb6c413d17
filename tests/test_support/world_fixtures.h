#pragma once
//
// Shared doubles for the world/game tests:
//   - TableLuck: pins the raw generator value of chosen cells, everything else rolls 0 (empty).
//   - RecordingRenderer / RecordingScore: count what the core told the presentation layer.
//   - At(): a point in the middle of a cell, so distances are exact-ish and CellOf is unambiguous.

#include "tokentrail/game/WorldSettings.hpp"
#include "tokentrail/grid/GeoGrid.hpp"
#include "tokentrail/grid/GridTypes.hpp"
#include "tokentrail/world/CellGenerator.hpp"
#include "tokentrail/world/CellRenderer.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace tokentrail::test {

class TableLuck final : public ICellLuck {
public:
    TableLuck& Set(GridCoord c, int raw)
    {
        m_raw[c] = raw;
        return *this;
    }

    double Sample(const GridCoord& c) const override
    {
        auto it = m_raw.find(c);
        const int raw = (it == m_raw.end()) ? 0 : it->second;
        return (raw + 0.5) / CellGenerator::kRawRange;
    }

private:
    std::unordered_map<GridCoord, int, GridCoordHasher> m_raw;
};

struct RecordingRenderer final : ICellRenderer {
    int materialized = 0;
    int updated      = 0;
    int evicted      = 0;
    int playerMoves  = 0;

    std::vector<GridCoord> updatedCells;
    GridCoord lastPlayerCell{};

    void OnCellMaterialized(const GridCoord&, const CellState&) override { ++materialized; }
    void OnCellUpdated(const GridCoord& c, const CellState&) override
    {
        ++updated;
        updatedCells.push_back(c);
    }
    void OnCellEvicted(const GridCoord&) override { ++evicted; }
    void OnPlayerMoved(const LatLng&, const GridCoord& cell) override
    {
        ++playerMoves;
        lastPlayerCell = cell;
    }
};

struct RecordingScore final : IScoreListener {
    std::vector<int> highest;
    int thresholdHits = 0;

    void OnHighestValueChanged(int value) override { highest.push_back(value); }
    void OnThresholdReached(int) override { ++thresholdHits; }
};

inline WorldSettings SmallWorld(int radiusCells)
{
    WorldSettings s;
    s.viewRadiusCells = radiusCells;
    return s;
}

inline LatLng At(const WorldSettings& s, GridCoord c)
{
    return s.geometry.CellCenter(c);
}

inline std::filesystem::path MakeUniqueTempPath(const char* stem, const char* ext)
{
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::filesystem::path p = std::filesystem::temp_directory_path();
    p /= std::string(stem) + "_" + std::to_string(static_cast<long long>(now)) + ext;
    return p;
}

} // namespace tokentrail::test
