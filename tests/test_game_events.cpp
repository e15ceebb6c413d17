#include <doctest/doctest.h>

#include "tokentrail/game/Game.hpp"
#include "tokentrail/io/AtomicFile.hpp"
#include "test_support/world_fixtures.h"

#include <filesystem>
#include <string>
#include <system_error>

using namespace tokentrail;

namespace {

namespace fs = std::filesystem;

GameConfig MakeConfig(const fs::path& saveFile)
{
    GameConfig cfg;
    cfg.world.viewRadiusCells = 3;
    cfg.world.worldSeed = 12345;
    cfg.saveFile = saveFile;
    return cfg;
}

// First token-bearing cell within reach of the player, if any.
bool FindReachableToken(const GameWorld& w, GridCoord& out)
{
    bool found = false;
    w.Cells().ForEachLive([&](const GridCoord& c, const CellState& s) {
        if (found || !s.hasToken)
            return;
        if (w.Tokens().DistanceTo(c) <= w.Settings().collectionRadiusMeters) {
            out = c;
            found = true;
        }
    });
    return found;
}

} // namespace

TEST_CASE("Game::Tick applies queued events in order")
{
    const fs::path save = test::MakeUniqueTempPath("tokentrail_game", ".json");
    test::RecordingRenderer renderer;
    test::RecordingScore score;
    Game game(MakeConfig(save), renderer, score);

    game.PushInput(GameEvent::Stepped(MoveDirection::North));
    game.PushInput(GameEvent::Stepped(MoveDirection::North));
    game.PushInput(GameEvent::Stepped(MoveDirection::East));
    CHECK(game.Tick() == 3u);
    CHECK(game.World().PlayerCell() == GridCoord{ 2, 1 });
    CHECK(game.EventsProcessed() == 3u);

    const LatLng target = game.World().Settings().geometry.CellCenter({ -5, 9 });
    game.PushInput(GameEvent::Moved(target));
    game.Tick();
    CHECK(game.World().PlayerCell() == GridCoord{ -5, 9 });
    CHECK(game.World().Player().position == target);

    // Nothing queued.
    CHECK(game.Tick() == 0u);

    game.PushInput(GameEvent::Moved(LatLng{ 1e300, 0.0 }));
    CHECK(game.Tick() == 1u);
    CHECK(game.Status() == "Ignored invalid position.");
    CHECK(game.World().Player().position == target);
}

TEST_CASE("Game: interaction events set the status line")
{
    const fs::path save = test::MakeUniqueTempPath("tokentrail_game_status", ".json");
    test::RecordingRenderer renderer;
    test::RecordingScore score;
    Game game(MakeConfig(save), renderer, score);

    game.PushInput(GameEvent::DoubleAt(game.World().PlayerCell()));
    game.Tick();
    REQUIRE(game.LastInteraction().has_value());
    CHECK(game.LastInteraction()->kind == InteractionKind::Double);
    CHECK(game.Status() == "No Token to Double!");

    GridCoord c;
    if (FindReachableToken(game.World(), c)) {
        game.PushInput(GameEvent::CollectAt(c));
        game.Tick();
        REQUIRE(game.LastInteraction().has_value());
        CHECK(game.LastInteraction()->Ok());
        CHECK(game.Status().rfind("Holding: Cell [", 0) == 0);
        CHECK(game.World().Player().held.has_value());
    }

    game.PushInput(GameEvent::CollectAt({ 9999, 9999 }));
    game.Tick();
    CHECK(game.LastInteraction()->status == InteractionStatus::NotLive);
}

TEST_CASE("Game: save, reset and load events")
{
    const fs::path save = test::MakeUniqueTempPath("tokentrail_game_save", ".json");
    struct Cleanup {
        fs::path a;
        ~Cleanup()
        {
            std::error_code ec;
            fs::remove(a, ec);
            fs::remove(io::default_backup_path(a), ec);
        }
    } cleanup{save};

    test::RecordingRenderer renderer;
    test::RecordingScore score;
    Game game(MakeConfig(save), renderer, score);

    game.PushInput(GameEvent::Stepped(MoveDirection::West));
    game.PushInput(GameEvent::Of(GameEventType::Save));
    game.Tick();
    CHECK(game.Status() == "Saved.");
    CHECK(fs::exists(save));

    game.PushInput(GameEvent::Of(GameEventType::Reset));
    game.Tick();
    CHECK(game.Status() == "New game.");
    CHECK(game.World().PlayerCell() == GridCoord{ 0, 0 });
    CHECK_FALSE(game.LastInteraction().has_value());

    game.PushInput(GameEvent::Of(GameEventType::Load));
    game.Tick();
    CHECK(game.Status() == "Loaded.");
    CHECK(game.World().PlayerCell() == GridCoord{ 0, -1 });

    std::error_code ec;
    fs::remove(save, ec);
    game.PushInput(GameEvent::Of(GameEventType::Load));
    game.Tick();
    CHECK(game.Status().rfind("Load failed (", 0) == 0);
    CHECK(game.World().PlayerCell() == GridCoord{ 0, 0 });
}

TEST_CASE("Game: events queued behind Quit are dropped")
{
    const fs::path save = test::MakeUniqueTempPath("tokentrail_game_quit", ".json");
    test::RecordingRenderer renderer;
    test::RecordingScore score;
    Game game(MakeConfig(save), renderer, score);

    game.PushInput(GameEvent::Stepped(MoveDirection::North));
    game.PushInput(GameEvent::Of(GameEventType::Quit));
    game.PushInput(GameEvent::Stepped(MoveDirection::North));

    CHECK(game.Tick() == 2u);
    CHECK(game.ShouldQuit());
    CHECK(game.World().PlayerCell() == GridCoord{ 1, 0 });
}
