#pragma once
#include "tokentrail/grid/GridTypes.hpp"
#include "tokentrail/world/CellState.hpp"

namespace tokentrail {

// Presentation collaborator. Owns whatever visuals it creates per cell;
// the core only tells it when a coordinate appears, changes or goes away.
struct ICellRenderer {
    virtual ~ICellRenderer() = default;

    virtual void OnCellMaterialized(const GridCoord& c, const CellState& s) = 0;
    virtual void OnCellUpdated(const GridCoord& c, const CellState& s) = 0;
    virtual void OnCellEvicted(const GridCoord& c) = 0;

    // Player marker / range indicator.
    virtual void OnPlayerMoved(const LatLng& position, const GridCoord& cell) = 0;
};

// HUD and win-banner hooks. Override what you need.
class IScoreListener {
public:
    virtual ~IScoreListener() = default;

    virtual void OnHighestValueChanged(int /*value*/) {}
    virtual void OnThresholdReached(int /*threshold*/) {}
};

} // namespace tokentrail
