#pragma once

#include "../model/board.hpp"
#include "../model/move_generator.hpp"
#include "../model/move_list.hpp"
#include "config.hpp"
#include "move_order.hpp"

namespace cotuong::engine {

// Pseudo-legal generation plus ordering for the search: hash move, captures by
// MVV-LVA, killers, then quiet moves by history.
class EngineMoveGen {
 public:
  explicit EngineMoveGen(const EngineConfig& cfg) noexcept : m_cfg(cfg) {}

  void generate(const model::Board& b, core::Color side, const model::Move& hashMove,
                const KillerSlots& killers, const HistoryTable& history,
                model::MoveList& out) const;

  // Captures only, best victim first.
  void generateCaptures(const model::Board& b, core::Color side, model::MoveList& out) const;

  int mvvLva(const model::Board& b, const model::Move& m) const noexcept;

 private:
  const EngineConfig& m_cfg;
  model::MoveGenerator m_gen;
};

}  // namespace cotuong::engine
