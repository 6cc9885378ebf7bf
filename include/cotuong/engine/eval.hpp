#pragma once

#include "../model/board.hpp"
#include "config.hpp"

namespace cotuong::engine {

class Evaluator final {
 public:
  // Weights are read from cfg on every call, so cfg may be retuned between searches.
  explicit Evaluator(const EngineConfig& cfg) noexcept : m_cfg(cfg) {}

  // Score from the point of view of `turn`.
  int evaluate(const model::Board& b, core::Color turn) const;
  // Red minus Black.
  int evaluateRed(const model::Board& b) const;

  Evaluator(const Evaluator&) = delete;
  Evaluator& operator=(const Evaluator&) = delete;

 private:
  const EngineConfig& m_cfg;
};

}  // namespace cotuong::engine
