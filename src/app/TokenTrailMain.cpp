// src/app/TokenTrailMain.cpp
//
// Console front-end. Reads one command per line from stdin:
//
//   n | s | e | w | ArrowUp | ...   step one cell
//   goto <lat> <lng>                 jump to a position
//   collect <i> <j>                  pick up the token in a cell
//   double <i> <j>                   merge the held token into a matching cell
//   look                             list reachable token cells
//   save | load | reset | quit

#include "tokentrail/core/Config.hpp"
#include "tokentrail/core/Log.hpp"
#include "tokentrail/game/Game.hpp"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

namespace {

using namespace tokentrail;

class ConsoleRenderer final : public ICellRenderer, public IScoreListener {
public:
    void OnCellMaterialized(const GridCoord& c, const CellState& s) override {
        spdlog::trace("+ cell [{}, {}] {}", c.i, c.j, s.ValueOr(0));
    }
    void OnCellUpdated(const GridCoord& c, const CellState& s) override {
        spdlog::debug("~ cell [{}, {}] {}", c.i, c.j, s.hasToken ? std::to_string(*s.tokenValue) : "-");
    }
    void OnCellEvicted(const GridCoord& c) override {
        spdlog::trace("- cell [{}, {}]", c.i, c.j);
    }
    void OnPlayerMoved(const LatLng& p, const GridCoord& cell) override {
        std::printf("You are at (%.6f, %.6f), cell [%d, %d]\n", p.lat, p.lng, cell.i, cell.j);
    }
    void OnHighestValueChanged(int value) override {
        std::printf("Highest token: %d\n", value);
    }
    void OnThresholdReached(int threshold) override {
        std::printf("*** You made a %d token. You win! ***\n", threshold);
    }
};

void PrintReachable(const GameWorld& world)
{
    const auto& tokens = world.Tokens();
    int shown = 0;
    world.Cells().ForEachLive([&](const GridCoord& c, const CellState& s) {
        if (!s.hasToken)
            return;
        const double d = tokens.DistanceTo(c);
        if (d > world.Settings().collectionRadiusMeters)
            return;

        const InteractionResult dbl = tokens.EvaluateDouble(c);
        std::printf("  [%d, %d] value %d (%.0fm)  collect: ok  double: %s\n",
                    c.i, c.j, *s.tokenValue, d,
                    dbl.Ok() ? "ok" : DescribeResult(dbl).c_str());
        ++shown;
    });

    if (shown == 0)
        std::printf("  nothing within %.0fm\n", world.Settings().collectionRadiusMeters);

    if (const auto& held = world.Player().held)
        std::printf("Holding %d from [%d, %d]\n", held->value, held->origin.i, held->origin.j);
}

bool ParseCell(std::istringstream& args, GridCoord& out)
{
    return static_cast<bool>(args >> out.i >> out.j);
}

} // namespace

int main(int argc, char** argv)
{
    std::filesystem::path configDir = ".";
    bool fileLog = true;
    for (int a = 1; a < argc; ++a) {
        if (std::strcmp(argv[a], "--config-dir") == 0 && a + 1 < argc)
            configDir = argv[++a];
        else if (std::strcmp(argv[a], "--no-file-log") == 0)
            fileLog = false;
    }

    core::Config cfg;
    const bool haveConfig = core::LoadConfig(cfg, configDir);

    core::LogConfig logCfg;
    logCfg.toFile = fileLog;
    logCfg.async  = cfg.asyncLogging;
    logCfg.level  = core::ParseLogLevel(cfg.logLevel, spdlog::level::info);
    core::InitLogging(logCfg);

    if (!haveConfig && !core::SaveConfig(cfg, configDir))
        spdlog::warn("Could not write default config to {}", configDir.string());

    GameConfig gameCfg;
    gameCfg.world    = SettingsFromConfig(cfg);
    gameCfg.saveFile = configDir / cfg.saveFile;

    ConsoleRenderer renderer;
    Game game(gameCfg, renderer, renderer);

    std::string line;
    while (!game.ShouldQuit() && std::getline(std::cin, line)) {
        std::istringstream args(line);
        std::string cmd;
        if (!(args >> cmd))
            continue;

        bool report = true;

        if (auto dir = DirectionFromKey(cmd)) {
            game.PushInput(GameEvent::Stepped(*dir));
            report = false;
        } else if (cmd == "goto") {
            LatLng p;
            if (!(args >> p.lat >> p.lng)) {
                std::printf("usage: goto <lat> <lng>\n");
                continue;
            }
            game.PushInput(GameEvent::Moved(p));
            report = false;
        } else if (cmd == "collect" || cmd == "double") {
            GridCoord c;
            if (!ParseCell(args, c)) {
                std::printf("usage: %s <i> <j>\n", cmd.c_str());
                continue;
            }
            game.PushInput(cmd == "collect" ? GameEvent::CollectAt(c) : GameEvent::DoubleAt(c));
        } else if (cmd == "look") {
            PrintReachable(game.World());
            continue;
        } else if (cmd == "save") {
            game.PushInput(GameEvent::Of(GameEventType::Save));
        } else if (cmd == "load") {
            game.PushInput(GameEvent::Of(GameEventType::Load));
        } else if (cmd == "reset") {
            game.PushInput(GameEvent::Of(GameEventType::Reset));
        } else if (cmd == "quit" || cmd == "q") {
            game.PushInput(GameEvent::Of(GameEventType::Quit));
            report = false;
        } else {
            std::printf("unknown command: %s\n", cmd.c_str());
            continue;
        }

        game.Tick();
        if (report && !game.Status().empty())
            std::printf("%s\n", game.Status().c_str());
    }

    core::ShutdownLogging();
    return 0;
}
