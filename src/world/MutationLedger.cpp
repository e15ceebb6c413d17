#include "tokentrail/world/MutationLedger.hpp"

#include <algorithm>

namespace tokentrail {

void MutationLedger::Save(const GridCoord& c, const CellState& s)
{
    m_entries.insert_or_assign(c, s);
}

std::optional<CellState> MutationLedger::Restore(const GridCoord& c) const
{
    auto it = m_entries.find(c);
    if (it == m_entries.end())
        return std::nullopt;
    return it->second;
}

std::vector<MutationLedger::Entry> MutationLedger::Entries() const
{
    std::vector<Entry> out(m_entries.begin(), m_entries.end());
    std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) {
        return a.first.i != b.first.i ? a.first.i < b.first.i : a.first.j < b.first.j;
    });
    return out;
}

void MutationLedger::Assign(const std::vector<Entry>& entries)
{
    m_entries.clear();
    m_entries.reserve(entries.size());
    for (const auto& [coord, state] : entries)
        m_entries.insert_or_assign(coord, state);
}

} // namespace tokentrail
