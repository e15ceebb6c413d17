#pragma once
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "tokentrail/grid/GridTypes.hpp"
#include "tokentrail/world/CellGenerator.hpp"
#include "tokentrail/world/CellRenderer.hpp"
#include "tokentrail/world/CellState.hpp"
#include "tokentrail/world/HighestValue.hpp"
#include "tokentrail/world/MutationLedger.hpp"

namespace tokentrail {

// Components carried by every live cell entity.
struct CellCoordComponent { GridCoord coord; };
struct CellStateComponent { CellState state; };

// Flyweight cache of the cells currently in view.
//
// A live cell is an entity in a private registry, indexed by coordinate.
// Eviction destroys the entity; the state survives in the ledger.
class CellStore {
public:
    struct Stats {
        std::uint64_t materialized = 0;
        std::uint64_t generated    = 0;  // state came from the generator
        std::uint64_t restored     = 0;  // state came from the ledger
        std::uint64_t evicted      = 0;
    };

    CellStore(MutationLedger& ledger,
              const CellGenerator& generator,
              HighestValueRecord& highest,
              ICellRenderer& renderer) noexcept;

    CellStore(const CellStore&) = delete;
    CellStore& operator=(const CellStore&) = delete;

    // Idempotent. The reference stays valid until the next structural change
    // (materialize/evict) of the store.
    const CellState& Materialize(const GridCoord& c);

    // Snapshots the current state into the ledger and drops the live cell.
    // No-op for coordinates that are not live.
    void Evict(const GridCoord& c);

    // Requires a live cell; throws std::logic_error otherwise.
    // Throws std::invalid_argument for states that break the CellState invariant.
    void SetState(const GridCoord& c, const CellState& s);

    // Same as SetState for live cells; for off-screen cells writes the ledger only.
    void WriteThrough(const GridCoord& c, const CellState& s);

    [[nodiscard]] const CellState* Find(const GridCoord& c) const;
    [[nodiscard]] bool IsLive(const GridCoord& c) const noexcept { return m_index.count(c) != 0; }
    [[nodiscard]] std::size_t LiveCount() const noexcept { return m_index.size(); }
    [[nodiscard]] std::vector<GridCoord> LiveCoords() const;

    // Drops every live cell without touching the ledger (reset/load path).
    void DiscardAll();

    template <typename Fn>
    void ForEachLive(Fn&& fn) const
    {
        m_registry.view<const CellCoordComponent, const CellStateComponent>().each(
            [&fn](const CellCoordComponent& coord, const CellStateComponent& state) {
                fn(coord.coord, state.state);
            });
    }

    [[nodiscard]] const Stats& GetStats() const noexcept { return m_stats; }

private:
    void Apply(entt::entity e, const GridCoord& c, const CellState& s);

    MutationLedger& m_ledger;
    const CellGenerator& m_generator;
    HighestValueRecord& m_highest;
    ICellRenderer& m_renderer;

    entt::registry m_registry;
    std::unordered_map<GridCoord, entt::entity, GridCoordHasher> m_index;
    Stats m_stats{};
};

} // namespace tokentrail
