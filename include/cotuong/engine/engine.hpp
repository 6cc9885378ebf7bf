#pragma once

#include <atomic>
#include <optional>
#include <utility>
#include <vector>

#include "../model/game_state.hpp"
#include "../model/move.hpp"
#include "config.hpp"
#include "search.hpp"

namespace cotuong::engine {

class Engine {
 public:
  explicit Engine(const EngineConfig& cfg = {});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Best move for the side to move (empty if none). The game state is not modified.
  std::optional<model::Move> find_best_move(const model::GameState& state,
                                            const SearchLimit& limit,
                                            const std::vector<model::Move>& excluded = {},
                                            const std::atomic<bool>* stop = nullptr);
  const SearchStats& getLastSearchStats() const;
  const EngineConfig& getConfig() const;

  // Takes effect on the next search; the TT is reallocated if its size changed.
  void setConfig(const EngineConfig& cfg);
  // Forget TT entries, killers and history between independent games.
  void newGame();

 private:
  struct Impl;
  Impl* pimpl;
};

// One-shot search with a throwaway engine.
std::pair<std::optional<model::Move>, SearchStats> search(const model::GameState& state,
                                                          const SearchLimit& limit,
                                                          const EngineConfig& cfg = {},
                                                          const std::vector<model::Move>& excluded = {});

}  // namespace cotuong::engine
