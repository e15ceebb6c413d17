#pragma once

// Save-format identifiers for GameWorld::ExportState / ImportState.

namespace tokentrail::savefmt {

inline constexpr const char* kWorldFormat = "TokenTrail.World";
// Version history
//  v1: player position, held token, highest value, ledger rows [i, j, hasToken, value]
inline constexpr int         kWorldVersion = 1;

} // namespace tokentrail::savefmt
