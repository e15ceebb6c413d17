#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tokentrail/game/GameWorld.hpp"

namespace tokentrail {

struct GameConfig {
  WorldSettings         world{};
  std::filesystem::path saveFile = "tokentrail_save.json";
};

enum class GameEventType : std::uint8_t {
  None = 0,
  Quit,
  PlayerMoved,   // absolute position (geolocation, drag)
  Step,          // one cell in a direction (keys, buttons)
  Collect,
  Double,
  Save,
  Load,
  Reset
};

struct GameEvent {
  GameEventType type      {GameEventType::None};
  LatLng        position  {};
  MoveDirection direction {MoveDirection::North};
  GridCoord     cell      {};

  static GameEvent Moved(const LatLng& p)    { GameEvent e; e.type = GameEventType::PlayerMoved; e.position = p; return e; }
  static GameEvent Stepped(MoveDirection d)  { GameEvent e; e.type = GameEventType::Step; e.direction = d; return e; }
  static GameEvent CollectAt(GridCoord c)    { GameEvent e; e.type = GameEventType::Collect; e.cell = c; return e; }
  static GameEvent DoubleAt(GridCoord c)     { GameEvent e; e.type = GameEventType::Double; e.cell = c; return e; }
  static GameEvent Of(GameEventType t)       { GameEvent e; e.type = t; return e; }
};

// Event-driven shell around GameWorld. Producers push events from anywhere;
// Tick() applies them one at a time, in order, on the owning thread.
class Game {
public:
  Game(const GameConfig& cfg, ICellRenderer& renderer, IScoreListener& score);
  ~Game();

  void PushInput(const GameEvent& e);

  // Drains the queue. Returns the number of events applied.
  std::size_t Tick();

  void RequestQuit();
  bool ShouldQuit() const noexcept { return !m_running.load(std::memory_order_relaxed); }

  GameWorld&        World()       noexcept { return m_world; }
  const GameWorld&  World() const noexcept { return m_world; }
  const GameConfig& Config() const noexcept { return m_config; }

  // Last HUD line ("Holding: ...", "Too far! (80m)", "Saved.").
  const std::string& Status() const noexcept { return m_status; }
  const std::optional<InteractionResult>& LastInteraction() const noexcept { return m_lastInteraction; }
  std::uint64_t EventsProcessed() const noexcept { return m_eventsProcessed; }

private:
  void processInputQueue(std::vector<GameEvent>& sink);
  void dispatch(const GameEvent& e);

private:
  GameConfig                       m_config;
  GameWorld                        m_world;

  // Input queue (any producer, single consumer in Tick)
  std::mutex                       m_inputMutex;
  std::vector<GameEvent>           m_inputQueue;

  std::string                      m_status;
  std::optional<InteractionResult> m_lastInteraction;
  std::uint64_t                    m_eventsProcessed{0};
  std::atomic_bool                 m_running{true};
};

} // namespace tokentrail
