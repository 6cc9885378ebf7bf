#pragma once

#include <atomic>
#include <optional>
#include <vector>

#include "../model/game_state.hpp"
#include "../model/move.hpp"
#include "engine.hpp"
#include "search.hpp"

namespace cotuong::engine {

struct SearchResult {
  std::optional<model::Move> bestMove;
  engine::SearchStats stats;
};

class BotEngine {
 public:
  explicit BotEngine(const EngineConfig& cfg = {});
  ~BotEngine();

  // Runs the search. thinkMillis = thinking time in ms (0 = depth only).
  // externalCancel may be nullptr; when set it is polled together with the clock.
  SearchResult findBestMove(const model::GameState& gameState, int maxDepth, int thinkMillis,
                            std::atomic<bool>* externalCancel = nullptr,
                            const std::vector<model::Move>& excluded = {});

  engine::SearchStats getLastSearchStats() const;

  Engine& engine() noexcept { return m_engine; }
  void setVerbose(bool v) noexcept { m_verbose = v; }

 private:
  Engine m_engine;
  bool m_verbose = true;
};

}  // namespace cotuong::engine
