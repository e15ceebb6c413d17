#include "tokentrail/world/CellGenerator.hpp"
#include "tokentrail/world/CellHash.hpp"

#include <algorithm>
#include <cmath>

namespace tokentrail {

double HashedLuck::Sample(const GridCoord& c) const
{
    return hash::to_unit(hash::hash_cell(m_seed, c));
}

int CellGenerator::RawValue(const GridCoord& c) const
{
    const double luck = m_luck->Sample(c);
    const int raw = static_cast<int>(std::floor(luck * kRawRange));
    return std::clamp(raw, 0, kRawRange - 1);
}

CellState CellGenerator::FromRaw(int raw) noexcept
{
    if (raw == kDeadValue)
        return CellState::Empty();
    if (raw >= kTokenMin && raw <= kTokenMax)
        return CellState::WithToken(raw);
    return CellState::Empty();
}

CellState CellGenerator::Generate(const GridCoord& c) const
{
    return FromRaw(RawValue(c));
}

} // namespace tokentrail
