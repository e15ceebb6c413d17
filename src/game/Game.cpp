#include "tokentrail/game/Game.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#ifdef TRACY_ENABLE
  #include <tracy/Tracy.hpp>
  #define TOKENTRAIL_TRACY_FRAME() FrameMark
  #define TOKENTRAIL_TRACY_ZONE(name_literal) ZoneScopedN(name_literal)
#else
  #define TOKENTRAIL_TRACY_FRAME()
  #define TOKENTRAIL_TRACY_ZONE(name_literal)
#endif

namespace tokentrail {

Game::Game(const GameConfig& cfg, ICellRenderer& renderer, IScoreListener& score)
  : m_config(cfg)
  , m_world(cfg.world, renderer, score)
{
  spdlog::info("TokenTrail initialized. seed={} viewRadius={} collectionRadius={}m save={}",
               cfg.world.worldSeed, cfg.world.viewRadiusCells,
               cfg.world.collectionRadiusMeters, cfg.saveFile.string());
}

Game::~Game() = default;

void Game::RequestQuit() {
  m_running = false;
}

void Game::PushInput(const GameEvent& e) {
  std::lock_guard<std::mutex> lock(m_inputMutex);
  m_inputQueue.emplace_back(e);
}

void Game::processInputQueue(std::vector<GameEvent>& sink) {
  std::lock_guard<std::mutex> lock(m_inputMutex);

  sink.clear();
  sink.swap(m_inputQueue);
}

std::size_t Game::Tick() {
  TOKENTRAIL_TRACY_ZONE("Game::Tick");

  std::vector<GameEvent> events;
  processInputQueue(events);

  std::size_t applied = 0;
  for (const auto& e : events) {
    if (!m_running.load(std::memory_order_relaxed))
      break; // events queued behind Quit are dropped
    dispatch(e);
    ++applied;
  }

  m_eventsProcessed += applied;
  TOKENTRAIL_TRACY_FRAME();
  return applied;
}

void Game::dispatch(const GameEvent& e) {
  switch (e.type) {
    case GameEventType::Quit:
      spdlog::info("Input: Quit requested");
      RequestQuit();
      break;

    case GameEventType::PlayerMoved:
      if (!IsValidPosition(e.position)) {
        m_status = "Ignored invalid position.";
        break;
      }
      m_world.OnPlayerMoved(e.position);
      break;

    case GameEventType::Step:
      m_world.MovePlayer(e.direction);
      break;

    case GameEventType::Collect:
      m_lastInteraction = m_world.AttemptCollect(e.cell);
      m_status = DescribeResult(*m_lastInteraction);
      break;

    case GameEventType::Double:
      m_lastInteraction = m_world.AttemptDouble(e.cell);
      m_status = DescribeResult(*m_lastInteraction);
      break;

    case GameEventType::Save: {
      std::string err;
      if (m_world.SaveJson(m_config.saveFile, &err)) {
        m_status = "Saved.";
      } else {
        spdlog::error("Save failed: {}", err);
        m_status = fmt::format("Save failed: {}", err);
      }
      break;
    }

    case GameEventType::Load: {
      std::string err;
      if (m_world.LoadJson(m_config.saveFile, &err)) {
        m_status = "Loaded.";
      } else {
        spdlog::warn("Load failed, starting fresh: {}", err);
        m_status = fmt::format("Load failed ({}); started fresh.", err);
      }
      break;
    }

    case GameEventType::Reset:
      m_world.Reset();
      m_lastInteraction.reset();
      m_status = "New game.";
      break;

    case GameEventType::None:
      break;
  }
}

} // namespace tokentrail
