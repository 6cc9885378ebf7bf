#include "cotuong/engine/engine_move_gen.hpp"

#include <algorithm>

namespace cotuong::engine {

int EngineMoveGen::mvvLva(const model::Board& b, const model::Move& m) const noexcept {
  const auto victim = b.getPiece(m.to);
  const auto attacker = b.getPiece(m.from);
  if (!victim || !attacker) return 0;
  return m_cfg.score_capture_base + m_cfg.pieceValue(model::bb::ti(victim->type)) -
         m_cfg.pieceValue(model::bb::ti(attacker->type)) / 10;
}

void EngineMoveGen::generate(const model::Board& b, core::Color side,
                             const model::Move& hashMove, const KillerSlots& killers,
                             const HistoryTable& history, model::MoveList& out) const {
  out.clear();
  m_gen.generatePseudoLegalMoves(b, side, out);

  int scores[model::MAX_MOVES];
  const int n = out.size();
  const auto& hist = history[model::bb::ci(side)];
  for (int i = 0; i < n; ++i) {
    const model::Move& m = out[i];
    if (!hashMove.isNull() && m == hashMove)
      scores[i] = m_cfg.score_hash_move;
    else if (m.isCapture())
      scores[i] = mvvLva(b, m);
    else if (m == killers[0])
      scores[i] = m_cfg.score_killer_move;
    else if (m == killers[1])
      scores[i] = m_cfg.score_killer_move - 1;
    else
      scores[i] = std::min(hist[m.from][m.to], m_cfg.score_history_max);
  }
  sort_by_score_desc(scores, out.data(), n);

  // A capture can outscore the configured hash bonus; the hash move still goes first.
  if (!hashMove.isNull() && n > 1 && !(out[0] == hashMove)) {
    auto it = std::find(out.begin(), out.end(), hashMove);
    if (it != out.end()) std::rotate(out.begin(), it, it + 1);
  }
}

void EngineMoveGen::generateCaptures(const model::Board& b, core::Color side,
                                     model::MoveList& out) const {
  out.clear();
  m_gen.generateCaptures(b, side, out);
  int scores[model::MAX_MOVES];
  const int n = out.size();
  for (int i = 0; i < n; ++i) scores[i] = mvvLva(b, out[i]);
  sort_by_score_desc(scores, out.data(), n);
}

}  // namespace cotuong::engine
