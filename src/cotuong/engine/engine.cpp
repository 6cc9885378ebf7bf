#include "cotuong/engine/engine.hpp"

#include <memory>

#include "cotuong/engine/eval.hpp"
#include "cotuong/engine/search.hpp"
#include "cotuong/model/core/attack_tables.hpp"
#include "cotuong/model/tt.hpp"
#include "cotuong/model/zobrist.hpp"

namespace cotuong::engine {

struct Engine::Impl {
  EngineConfig cfg;
  model::TranspositionTable tt;

  // Evaluator and Search keep references to cfg and tt.
  Evaluator eval;
  std::unique_ptr<Search> search;

  explicit Impl(const EngineConfig& c) : cfg(c), tt(c.tt_size_mb), eval(cfg) {
    model::Zobrist::init();
    model::AttackTables::get();
    search = std::make_unique<Search>(tt, eval, cfg);
  }
};

Engine::Engine(const EngineConfig& cfg) : pimpl(new Impl(cfg)) {}

Engine::~Engine() {
  delete pimpl;
}

std::optional<model::Move> Engine::find_best_move(const model::GameState& state,
                                                  const SearchLimit& limit,
                                                  const std::vector<model::Move>& excluded,
                                                  const std::atomic<bool>* stop) {
  return pimpl->search->searchRoot(state, limit, excluded, stop);
}

const SearchStats& Engine::getLastSearchStats() const {
  return pimpl->search->getStats();
}

const EngineConfig& Engine::getConfig() const {
  return pimpl->cfg;
}

void Engine::setConfig(const EngineConfig& cfg) {
  const bool resize = cfg.tt_size_mb != pimpl->cfg.tt_size_mb;
  pimpl->cfg = cfg;
  if (resize) pimpl->tt.resize(cfg.tt_size_mb);
}

void Engine::newGame() {
  pimpl->tt.clear();
  pimpl->search->clearSearchState();
}

std::pair<std::optional<model::Move>, SearchStats> search(const model::GameState& state,
                                                          const SearchLimit& limit,
                                                          const EngineConfig& cfg,
                                                          const std::vector<model::Move>& excluded) {
  Engine engine(cfg);
  auto best = engine.find_best_move(state, limit, excluded);
  return {best, engine.getLastSearchStats()};
}

}  // namespace cotuong::engine
