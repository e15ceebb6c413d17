// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.cpp.
//
// Goals:
//   - Saving creates the directory + writes tokentrail.ini
//   - Loading round-trips values (doubles bit-exact)
//   - Corrupt values do not throw and do not clobber what was there

#include <doctest/doctest.h>

#include "tokentrail/core/Config.hpp"
#include "tokentrail/game/WorldSettings.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace tokentrail;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("tokentrail_core_config_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void write_ini(const fs::path& dir, const std::string& text)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    std::ofstream f(dir / core::kConfigFileName, std::ios::binary | std::ios::trunc);
    REQUIRE(f.good());
    f << text;
}

} // namespace

TEST_CASE("core::SaveConfig creates tokentrail.ini and core::LoadConfig round-trips values")
{
    const fs::path dir = make_unique_temp_dir() / "roundtrip";

    core::Config cfg;
    cfg.viewRadiusCells = 12;
    cfg.collectionRadiusMeters = 75.5;
    cfg.winThreshold = 512;
    cfg.originLat = 51.477928;
    cfg.originLng = -0.001545;
    cfg.worldSeed = 0xDEADBEEFCAFEull;
    cfg.saveFile = "slot1.json";
    cfg.logLevel = "debug";
    cfg.asyncLogging = true;

    CHECK(core::SaveConfig(cfg, dir));
    CHECK(fs::exists(dir / core::kConfigFileName));

    core::Config loaded;
    CHECK(core::LoadConfig(loaded, dir));
    CHECK(loaded.cellDegrees == cfg.cellDegrees);
    CHECK(loaded.viewRadiusCells == 12);
    CHECK(loaded.collectionRadiusMeters == 75.5);
    CHECK(loaded.winThreshold == 512);
    CHECK(loaded.originLat == cfg.originLat);
    CHECK(loaded.originLng == cfg.originLng);
    CHECK(loaded.worldSeed == cfg.worldSeed);
    CHECK(loaded.saveFile == "slot1.json");
    CHECK(loaded.logLevel == "debug");
    CHECK(loaded.asyncLogging == true);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig returns false for missing file (first run)")
{
    const fs::path dir = make_unique_temp_dir() / "missing";
    std::error_code ec;
    fs::create_directories(dir, ec);

    core::Config cfg;
    cfg.viewRadiusCells = 7;
    CHECK_FALSE(core::LoadConfig(cfg, dir));
    CHECK(cfg.viewRadiusCells == 7);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig tolerates corrupt values (does not throw)")
{
    const fs::path dir = make_unique_temp_dir() / "corrupt";
    write_ini(dir,
              "viewRadiusCells=not_an_int\n"
              "winThreshold=4096\n"
              "collectionRadiusMeters=12.5abc\n"
              "asyncLogging=maybe\n"
              "worldSeed=-1\n");

    core::Config cfg;
    cfg.viewRadiusCells = 11;            // unchanged (invalid)
    cfg.collectionRadiusMeters = 33.0;   // unchanged (trailing garbage)
    cfg.asyncLogging = true;             // unchanged (invalid bool)
    cfg.worldSeed = 5;                   // unchanged (negative)

    CHECK(core::LoadConfig(cfg, dir));
    CHECK(cfg.viewRadiusCells == 11);
    CHECK(cfg.winThreshold == 4096);
    CHECK(cfg.collectionRadiusMeters == 33.0);
    CHECK(cfg.asyncLogging == true);
    CHECK(cfg.worldSeed == 5u);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig clamps out-of-range values")
{
    const fs::path dir = make_unique_temp_dir() / "clamp";
    write_ini(dir,
              "viewRadiusCells=100000\n"
              "collectionRadiusMeters=-3\n"
              "winThreshold=0\n"
              "originLat=95\n"
              "cellDegrees=0\n");

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, dir));
    CHECK(cfg.viewRadiusCells == 256);
    CHECK(cfg.collectionRadiusMeters == 0.0);
    CHECK(cfg.winThreshold == 1);
    CHECK(cfg.originLat == 90.0);
    CHECK(cfg.cellDegrees == core::Config{}.cellDegrees);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig supports comments and a UTF-8 BOM")
{
    const fs::path dir = make_unique_temp_dir() / "comments";
    write_ini(dir,
              "\xEF\xBB\xBFviewRadiusCells=10 # cells\n"
              "winThreshold=1024 ; tiles\n"
              "logLevel=warn // quiet\n"
              "; whole line comment\n"
              "# whole line comment\n"
              "unknownKey=1\n");

    core::Config cfg;
    CHECK(core::LoadConfig(cfg, dir));
    CHECK(cfg.viewRadiusCells == 10);
    CHECK(cfg.winThreshold == 1024);
    CHECK(cfg.logLevel == "warn");

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadConfig keeps comment characters that are part of a value")
{
    const fs::path dir = make_unique_temp_dir() / "inline_markers";

    SUBCASE("markers glued to the path")
    {
        write_ini(dir, "saveFile=saves/slot#1;a.json\n");
        core::Config cfg;
        CHECK(core::LoadConfig(cfg, dir));
        CHECK(cfg.saveFile == "saves/slot#1;a.json");
    }

    SUBCASE("double slash inside the path, comment after it")
    {
        write_ini(dir, "saveFile=run//1.json # note\n");
        core::Config cfg;
        CHECK(core::LoadConfig(cfg, dir));
        CHECK(cfg.saveFile == "run//1.json");
    }

    SUBCASE("a value that is only a comment leaves the field alone")
    {
        write_ini(dir, "logLevel=# nothing\n");
        core::Config cfg;
        cfg.logLevel = "error";
        CHECK(core::LoadConfig(cfg, dir));
        CHECK(cfg.logLevel == "error");
    }

    SUBCASE("SaveConfig round-trips such a path")
    {
        core::Config out;
        out.saveFile = "a#b;c//d.json";
        REQUIRE(core::SaveConfig(out, dir));
        core::Config in;
        CHECK(core::LoadConfig(in, dir));
        CHECK(in.saveFile == "a#b;c//d.json");
    }

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("SettingsFromConfig carries every world knob")
{
    core::Config cfg;
    cfg.cellDegrees = 2e-4;
    cfg.viewRadiusCells = 5;
    cfg.collectionRadiusMeters = 20.0;
    cfg.winThreshold = 64;
    cfg.originLat = 1.0;
    cfg.originLng = 2.0;
    cfg.worldSeed = 99;

    const WorldSettings s = SettingsFromConfig(cfg);
    CHECK(s.geometry.cellDegrees == 2e-4);
    CHECK(s.geometry.origin == LatLng{ 1.0, 2.0 });
    CHECK(s.viewRadiusCells == 5);
    CHECK(s.collectionRadiusMeters == 20.0);
    CHECK(s.winThreshold == 64);
    CHECK(s.worldSeed == 99u);
}
