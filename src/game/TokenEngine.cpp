#include "tokentrail/game/TokenEngine.hpp"

#include <cmath>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace tokentrail {

const char* StatusName(InteractionStatus s) noexcept
{
    switch (s) {
    case InteractionStatus::Ok:               return "ok";
    case InteractionStatus::TooFar:           return "too_far";
    case InteractionStatus::NothingToCollect: return "nothing_to_collect";
    case InteractionStatus::NoTokenHeld:      return "no_token_held";
    case InteractionStatus::NothingToDouble:  return "nothing_to_double";
    case InteractionStatus::ValueMismatch:    return "value_mismatch";
    case InteractionStatus::ValueTooLarge:    return "value_too_large";
    case InteractionStatus::NotLive:          return "not_live";
    }
    return "unknown";
}

std::string DescribeResult(const InteractionResult& r)
{
    const GridCoord& c = r.coord;
    switch (r.status) {
    case InteractionStatus::Ok:
        if (r.kind == InteractionKind::Collect)
            return fmt::format("Holding: Cell [{}, {}] → Value: {}", c.i, c.j, r.newValue.value_or(0));
        return fmt::format("Double: Cell [{}, {}] → Value: {}", c.i, c.j, r.newValue.value_or(0));
    case InteractionStatus::TooFar:
        return fmt::format("Too far! ({}m)", std::lround(r.distanceMeters));
    case InteractionStatus::NothingToCollect:
        return fmt::format("Nothing to collect at [{}, {}]", c.i, c.j);
    case InteractionStatus::NoTokenHeld:
        return "No Token to Double!";
    case InteractionStatus::NothingToDouble:
        return fmt::format("Nothing to double at [{}, {}]", c.i, c.j);
    case InteractionStatus::ValueMismatch:
        return fmt::format("Invalid Double, Need:({})", r.heldValue.value_or(0));
    case InteractionStatus::ValueTooLarge:
        return fmt::format("Cell [{}, {}] cannot grow past {}", c.i, c.j, r.cellValue.value_or(0));
    case InteractionStatus::NotLive:
        return fmt::format("Cell [{}, {}] is not visible", c.i, c.j);
    }
    return {};
}

double TokenEngine::DistanceTo(const GridCoord& c) const noexcept
{
    return DistanceMeters(m_player.position, m_settings.geometry.CellCenter(c));
}

InteractionResult TokenEngine::EvaluateCollect(const GridCoord& c) const
{
    InteractionResult r;
    r.kind  = InteractionKind::Collect;
    r.coord = c;
    if (m_player.held)
        r.heldValue = m_player.held->value;

    const CellState* cell = m_cells.Find(c);
    if (!cell) {
        r.status = InteractionStatus::NotLive;
        return r;
    }

    r.cellValue      = cell->tokenValue;
    r.distanceMeters = DistanceTo(c);

    if (r.distanceMeters > m_settings.collectionRadiusMeters) {
        r.status = InteractionStatus::TooFar;
        return r;
    }
    if (!cell->hasToken) {
        r.status = InteractionStatus::NothingToCollect;
        return r;
    }

    r.status   = InteractionStatus::Ok;
    r.newValue = cell->tokenValue;
    return r;
}

InteractionResult TokenEngine::EvaluateDouble(const GridCoord& c) const
{
    InteractionResult r;
    r.kind  = InteractionKind::Double;
    r.coord = c;
    if (m_player.held)
        r.heldValue = m_player.held->value;

    const CellState* cell = m_cells.Find(c);
    if (!cell) {
        r.status = InteractionStatus::NotLive;
        return r;
    }

    r.cellValue      = cell->tokenValue;
    r.distanceMeters = DistanceTo(c);

    if (r.distanceMeters > m_settings.collectionRadiusMeters) {
        r.status = InteractionStatus::TooFar;
        return r;
    }
    if (!m_player.held) {
        r.status = InteractionStatus::NoTokenHeld;
        return r;
    }
    if (!cell->hasToken) {
        r.status = InteractionStatus::NothingToDouble;
        return r;
    }
    if (m_player.held->value != *cell->tokenValue) {
        r.status = InteractionStatus::ValueMismatch;
        return r;
    }
    if (*cell->tokenValue > kMaxDoublableValue) {
        r.status = InteractionStatus::ValueTooLarge;
        return r;
    }

    r.status   = InteractionStatus::Ok;
    r.newValue = *cell->tokenValue * 2;
    return r;
}

InteractionResult TokenEngine::Collect(const GridCoord& c)
{
    InteractionResult r = EvaluateCollect(c);
    if (!r.Ok()) {
        spdlog::debug("Collect [{}, {}] rejected: {}", c.i, c.j, StatusName(r.status));
        return r;
    }

    // Return the token we are already carrying to the cell it came from.
    if (m_player.held) {
        const PlayerToken prev = *m_player.held;
        m_cells.WriteThrough(prev.origin, CellState::WithToken(prev.value));
        spdlog::debug("Returned token {} to [{}, {}]", prev.value, prev.origin.i, prev.origin.j);
    }

    m_player.held = PlayerToken{ *r.newValue, c };
    m_cells.SetState(c, CellState::Empty());

    spdlog::info("Collected token {} from [{}, {}]", *r.newValue, c.i, c.j);
    return r;
}

InteractionResult TokenEngine::Double(const GridCoord& c)
{
    InteractionResult r = EvaluateDouble(c);
    if (!r.Ok()) {
        spdlog::debug("Double [{}, {}] rejected: {}", c.i, c.j, StatusName(r.status));
        return r;
    }

    m_cells.SetState(c, CellState::WithToken(*r.newValue));
    m_player.held.reset();

    spdlog::info("Doubled [{}, {}] to {}", c.i, c.j, *r.newValue);
    return r;
}

} // namespace tokentrail
