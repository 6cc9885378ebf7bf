#pragma once

#include "board.hpp"
#include "move_list.hpp"

namespace cotuong::model {

class MoveGenerator {
 public:
  // Every move obeying piece movement rules and not landing on a friendly piece.
  void generatePseudoLegalMoves(const Board& b, core::Color side, MoveList& out) const;

  // Captures only (quiescence).
  void generateCaptures(const Board& b, core::Color side, MoveList& out) const;

  // Pseudo-legal moves filtered by apply/undo on `b`; `b` is restored before returning.
  MoveList generateLegalMoves(Board& b, core::Color side) const;

  // Stops at the first legal move.
  bool hasLegalMoves(Board& b, core::Color side) const;

  // True if `mv` (pseudo-legal for side) leaves neither own general attacked nor generals facing.
  static bool isLegalAfterApply(Board& b, const Move& mv, core::Color side);

  static bool isInCheck(const Board& b, core::Color side) noexcept;
  static bool isFlyingGeneral(const Board& b) noexcept;
};

}  // namespace cotuong::model
