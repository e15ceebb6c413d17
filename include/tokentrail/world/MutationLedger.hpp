#pragma once
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tokentrail/grid/GridTypes.hpp"
#include "tokentrail/world/CellState.hpp"

namespace tokentrail {

// Latest known state of every cell that was ever materialized and touched.
// Total map: restoring an unknown coordinate yields nullopt, never a fault.
class MutationLedger {
public:
    using Entry = std::pair<GridCoord, CellState>;

    void Save(const GridCoord& c, const CellState& s);
    [[nodiscard]] std::optional<CellState> Restore(const GridCoord& c) const;

    [[nodiscard]] bool Contains(const GridCoord& c) const noexcept { return m_entries.count(c) != 0; }
    [[nodiscard]] std::size_t Size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_entries.empty(); }

    void Clear() noexcept { m_entries.clear(); }

    // Sorted by (i, j) so saves are byte-stable.
    [[nodiscard]] std::vector<Entry> Entries() const;

    // Replaces the whole content (used by load).
    void Assign(const std::vector<Entry>& entries);

private:
    std::unordered_map<GridCoord, CellState, GridCoordHasher> m_entries;
};

} // namespace tokentrail
