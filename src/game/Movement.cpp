#include "tokentrail/game/Movement.hpp"

#include <array>
#include <cctype>

namespace tokentrail {

namespace {

struct KeyBinding {
    std::string_view key;   // lower-case
    MoveDirection    dir;
};

// Keyboard keys, vi keys, console words and on-screen button ids.
constexpr std::array<KeyBinding, 20> kKeyTable{{
    { "arrowup",    MoveDirection::North },
    { "w",          MoveDirection::North },
    { "k",          MoveDirection::North },
    { "n",          MoveDirection::North },
    { "north",      MoveDirection::North },
    { "up",         MoveDirection::North },

    { "arrowdown",  MoveDirection::South },
    { "s",          MoveDirection::South },
    { "j",          MoveDirection::South },
    { "south",      MoveDirection::South },
    { "down",       MoveDirection::South },

    { "arrowright", MoveDirection::East },
    { "d",          MoveDirection::East },
    { "l",          MoveDirection::East },
    { "e",          MoveDirection::East },
    { "east",       MoveDirection::East },

    { "arrowleft",  MoveDirection::West },
    { "a",          MoveDirection::West },
    { "h",          MoveDirection::West },
    { "west",       MoveDirection::West },
}};

[[nodiscard]] bool IsWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

[[nodiscard]] bool EqualsLower(std::string_view s, std::string_view lower) noexcept
{
    if (s.size() != lower.size())
        return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (static_cast<char>(std::tolower(c)) != lower[i])
            return false;
    }
    return true;
}

} // namespace

const char* DirectionName(MoveDirection d) noexcept
{
    switch (d) {
    case MoveDirection::North: return "north";
    case MoveDirection::South: return "south";
    case MoveDirection::East:  return "east";
    case MoveDirection::West:  return "west";
    case MoveDirection::Count: break;
    }
    return "none";
}

std::optional<MoveDirection> DirectionFromKey(std::string_view key) noexcept
{
    while (!key.empty() && IsWhitespace(key.front())) key.remove_prefix(1);
    while (!key.empty() && IsWhitespace(key.back())) key.remove_suffix(1);
    if (key.empty())
        return std::nullopt;

    for (const KeyBinding& b : kKeyTable) {
        if (EqualsLower(key, b.key))
            return b.dir;
    }
    return std::nullopt;
}

LatLng StepPosition(const LatLng& p, MoveDirection d, double cellDegrees) noexcept
{
    switch (d) {
    case MoveDirection::North: return LatLng{ p.lat + cellDegrees, p.lng };
    case MoveDirection::South: return LatLng{ p.lat - cellDegrees, p.lng };
    case MoveDirection::East:  return LatLng{ p.lat, p.lng + cellDegrees };
    case MoveDirection::West:  return LatLng{ p.lat, p.lng - cellDegrees };
    case MoveDirection::Count: break;
    }
    return p;
}

} // namespace tokentrail
