#pragma once
#include <cstdint>

#include "tokentrail/grid/GridTypes.hpp"
#include "tokentrail/world/CellState.hpp"

namespace tokentrail {

// Source of reproducible per-cell luck in [0,1).
// Implementations must be pure functions of the coordinate.
struct ICellLuck {
    virtual ~ICellLuck() = default;
    [[nodiscard]] virtual double Sample(const GridCoord& c) const = 0;
};

class HashedLuck final : public ICellLuck {
public:
    explicit HashedLuck(std::uint64_t worldSeed = 0) noexcept : m_seed(worldSeed) {}

    [[nodiscard]] double Sample(const GridCoord& c) const override;
    [[nodiscard]] std::uint64_t Seed() const noexcept { return m_seed; }

private:
    std::uint64_t m_seed;
};

// Turns luck into the initial state of a never-touched cell.
class CellGenerator {
public:
    static constexpr int kRawRange  = 10; // raw values 0..9
    static constexpr int kDeadValue = 3;  // always remapped to "no token"
    static constexpr int kTokenMin  = 1;
    static constexpr int kTokenMax  = 4;

    explicit CellGenerator(const ICellLuck& luck) noexcept : m_luck(&luck) {}

    [[nodiscard]] int RawValue(const GridCoord& c) const;
    [[nodiscard]] CellState Generate(const GridCoord& c) const;

    // The rule on its own, for callers that already hold a raw value.
    [[nodiscard]] static CellState FromRaw(int raw) noexcept;

private:
    const ICellLuck* m_luck;
};

} // namespace tokentrail
