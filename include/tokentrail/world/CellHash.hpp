#pragma once
#include <cstdint>

#include "tokentrail/grid/GridTypes.hpp"

namespace tokentrail::hash {

// SplitMix64 finalizer (Sebastiano Vigna).
constexpr std::uint64_t splitmix64(std::uint64_t x) noexcept {
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}

// 64-bit mix (Murmur3 fmix64)
constexpr std::uint64_t hash64(std::uint64_t x) noexcept {
    x ^= x >> 33; x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33; x *= 0xc4ceb9fe1a85ec53ULL;
    return x ^ (x >> 33);
}

constexpr std::uint64_t hash_cell(std::uint64_t worldSeed, const GridCoord& c) noexcept {
    const std::uint64_t packed = (std::uint64_t(std::uint32_t(c.i)) << 32) ^ std::uint64_t(std::uint32_t(c.j));
    return splitmix64(worldSeed ^ hash64(packed));
}

// Top 53 bits -> [0,1)
constexpr double to_unit(std::uint64_t h) noexcept {
    return static_cast<double>(h >> 11) * (1.0 / 9007199254740992.0);
}

} // namespace tokentrail::hash
