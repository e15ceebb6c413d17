#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace tokentrail::core {

inline constexpr const char* kConfigFileName = "tokentrail.ini";

struct Config {
    double        cellDegrees            = 1e-4;
    int           viewRadiusCells        = 24;
    double        collectionRadiusMeters = 50.0;
    int           winThreshold           = 2048;
    double        originLat              = 36.997936938057016;
    double        originLng              = -122.05703507501151;
    std::uint64_t worldSeed              = 0;

    std::string   saveFile               = "tokentrail_save.json";
    std::string   logLevel               = "info";
    bool          asyncLogging           = false;
};

// Missing file returns false and leaves `cfg` untouched. Unparseable values
// keep their previous value; out-of-range values are clamped.
bool LoadConfig(Config& cfg, const std::filesystem::path& saveDir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& saveDir);

} // namespace tokentrail::core
