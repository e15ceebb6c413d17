#include "tokentrail/game/WorldSettings.hpp"
#include "tokentrail/core/Config.hpp"

namespace tokentrail {

WorldSettings SettingsFromConfig(const core::Config& cfg) noexcept
{
    WorldSettings s;
    s.geometry.origin         = LatLng{ cfg.originLat, cfg.originLng };
    s.geometry.cellDegrees    = cfg.cellDegrees;
    s.viewRadiusCells         = cfg.viewRadiusCells;
    s.collectionRadiusMeters  = cfg.collectionRadiusMeters;
    s.winThreshold            = cfg.winThreshold;
    s.worldSeed               = cfg.worldSeed;
    return s;
}

} // namespace tokentrail
