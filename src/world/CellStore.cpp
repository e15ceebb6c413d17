#include "tokentrail/world/CellStore.hpp"

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace tokentrail {

namespace {

[[nodiscard]] std::string CoordText(const GridCoord& c)
{
    return "[" + std::to_string(c.i) + ", " + std::to_string(c.j) + "]";
}

void RequireValid(const GridCoord& c, const CellState& s)
{
    if (!s.IsValid())
        throw std::invalid_argument("CellStore: state for cell " + CoordText(c) +
                                    " breaks the hasToken/tokenValue invariant.");
}

} // namespace

CellStore::CellStore(MutationLedger& ledger,
                     const CellGenerator& generator,
                     HighestValueRecord& highest,
                     ICellRenderer& renderer) noexcept
: m_ledger(ledger), m_generator(generator), m_highest(highest), m_renderer(renderer) {}

const CellState& CellStore::Materialize(const GridCoord& c)
{
    if (auto it = m_index.find(c); it != m_index.end())
        return m_registry.get<CellStateComponent>(it->second).state;

    CellState state;
    if (auto saved = m_ledger.Restore(c)) {
        state = *saved;
        ++m_stats.restored;
    } else {
        state = m_generator.Generate(c);
        ++m_stats.generated;
    }

    const entt::entity e = m_registry.create();
    m_registry.emplace<CellCoordComponent>(e, c);
    auto& comp = m_registry.emplace<CellStateComponent>(e, state);
    m_index.emplace(c, e);
    ++m_stats.materialized;

    if (state.hasToken)
        m_highest.Observe(*state.tokenValue);

    m_renderer.OnCellMaterialized(c, comp.state);
    return comp.state;
}

void CellStore::Evict(const GridCoord& c)
{
    auto it = m_index.find(c);
    if (it == m_index.end())
        return;

    // Unconditional snapshot: a cell the player has seen never re-rolls.
    const entt::entity e = it->second;
    m_ledger.Save(c, m_registry.get<CellStateComponent>(e).state);

    m_registry.destroy(e);
    m_index.erase(it);
    ++m_stats.evicted;

    m_renderer.OnCellEvicted(c);
}

void CellStore::SetState(const GridCoord& c, const CellState& s)
{
    auto it = m_index.find(c);
    if (it == m_index.end())
        throw std::logic_error("CellStore::SetState: cell " + CoordText(c) + " is not materialized.");

    RequireValid(c, s);
    Apply(it->second, c, s);
}

void CellStore::WriteThrough(const GridCoord& c, const CellState& s)
{
    RequireValid(c, s);

    if (auto it = m_index.find(c); it != m_index.end()) {
        Apply(it->second, c, s);
        return;
    }

    spdlog::debug("Cell {} is off-screen; writing state to the ledger only", CoordText(c));
    m_ledger.Save(c, s);
    if (s.hasToken)
        m_highest.Observe(*s.tokenValue);
}

void CellStore::Apply(entt::entity e, const GridCoord& c, const CellState& s)
{
    m_registry.get<CellStateComponent>(e).state = s;
    m_ledger.Save(c, s);

    if (s.hasToken)
        m_highest.Observe(*s.tokenValue);

    m_renderer.OnCellUpdated(c, s);
}

const CellState* CellStore::Find(const GridCoord& c) const
{
    auto it = m_index.find(c);
    if (it == m_index.end())
        return nullptr;
    return &m_registry.get<CellStateComponent>(it->second).state;
}

std::vector<GridCoord> CellStore::LiveCoords() const
{
    std::vector<GridCoord> out;
    out.reserve(m_index.size());
    for (const auto& kv : m_index)
        out.push_back(kv.first);
    return out;
}

void CellStore::DiscardAll()
{
    for (const auto& kv : m_index)
        m_renderer.OnCellEvicted(kv.first);

    m_index.clear();
    m_registry.clear();
}

} // namespace tokentrail
