#pragma once
#include <optional>

namespace tokentrail {

// Mutable gameplay payload of one cell.
// Invariant: hasToken == tokenValue.has_value() && *tokenValue > 0.
struct CellState {
    bool hasToken = false;
    std::optional<int> tokenValue;

    [[nodiscard]] static CellState Empty() noexcept { return CellState{}; }

    // A value of 0 (or below) is "no token".
    [[nodiscard]] static CellState WithToken(int value) noexcept
    {
        if (value <= 0) return Empty();
        return CellState{ true, value };
    }

    [[nodiscard]] bool IsValid() const noexcept
    {
        if (hasToken) return tokenValue.has_value() && *tokenValue > 0;
        return !tokenValue.has_value();
    }

    [[nodiscard]] int ValueOr(int def) const noexcept { return tokenValue.value_or(def); }

    bool operator==(const CellState& o) const noexcept
    {
        return hasToken == o.hasToken && tokenValue == o.tokenValue;
    }
    bool operator!=(const CellState& o) const noexcept { return !(*this == o); }
};

} // namespace tokentrail
