#include "cotuong/model/move_generator.hpp"

#include "cotuong/model/core/attack_tables.hpp"
#include "cotuong/model/move_helper.hpp"

namespace cotuong::model {

namespace {

using core::Color;
using core::PieceType;
using core::Square;

enum class GenMode { All, Captures };

inline void emit(const Board& b, Square from, bb::Bitboard targets, MoveList& out) {
  while (targets) {
    const Square to = bb::pop_lsb(targets);
    const auto victim = b.getPiece(to);
    out.push(Move(from, to, victim ? victim->type : PieceType::None));
  }
}

template <GenMode M>
void generate(const Board& b, Color side, MoveList& out) {
  const AttackTables& t = AttackTables::get();
  const bb::Bitboard own = b.getPieces(side);
  const bb::Bitboard enemy = b.getPieces(~side);
  const bb::Bitboard mask = M == GenMode::Captures ? enemy : ~own & bb::BOARD_MASK;

  // One branch per piece type; the set of types is closed.
  for (int ti = 0; ti < core::PIECE_TYPE_NB; ++ti) {
    const auto pt = static_cast<PieceType>(ti);
    bb::Bitboard pieces = b.getPieces(side, pt);
    while (pieces) {
      const Square from = bb::pop_lsb(pieces);
      bb::Bitboard targets = 0;
      switch (pt) {
        case PieceType::General:
          targets = t.general(from);
          break;
        case PieceType::Advisor:
          targets = t.advisor(from);
          break;
        case PieceType::Elephant:
          targets = elephant_targets(t, b, from);
          break;
        case PieceType::Horse:
          targets = horse_targets(t, b, from);
          break;
        case PieceType::Rook:
          targets = rook_attacks(t, b, from);
          break;
        case PieceType::Cannon:
          targets = cannon_captures(t, b, from) & enemy;
          if constexpr (M == GenMode::All) targets |= cannon_quiets(t, b, from);
          break;
        case PieceType::Soldier:
          targets = t.soldier(side, from);
          break;
        case PieceType::None:
          break;
      }
      emit(b, from, targets & mask, out);
    }
  }
}

}  // namespace

void MoveGenerator::generatePseudoLegalMoves(const Board& b, Color side, MoveList& out) const {
  generate<GenMode::All>(b, side, out);
}

void MoveGenerator::generateCaptures(const Board& b, Color side, MoveList& out) const {
  generate<GenMode::Captures>(b, side, out);
}

bool MoveGenerator::isInCheck(const Board& b, Color side) noexcept {
  const Square g = b.generalSquare(side);
  if (g == core::NO_SQUARE) return false;
  return attackedBy(b, g, ~side);
}

bool MoveGenerator::isFlyingGeneral(const Board& b) noexcept {
  return generalsFacing(b);
}

bool MoveGenerator::isLegalAfterApply(Board& b, const Move& mv, Color side) {
  const auto captured = b.applyMove(mv, side);
  const bool legal = !isInCheck(b, side) && !isFlyingGeneral(b);
  b.undoMove(mv, captured, side);
  return legal;
}

MoveList MoveGenerator::generateLegalMoves(Board& b, Color side) const {
  MoveList pseudo;
  generatePseudoLegalMoves(b, side, pseudo);
  MoveList legal;
  for (const Move& m : pseudo)
    if (isLegalAfterApply(b, m, side)) legal.push(m);
  return legal;
}

bool MoveGenerator::hasLegalMoves(Board& b, Color side) const {
  MoveList pseudo;
  generatePseudoLegalMoves(b, side, pseudo);
  for (const Move& m : pseudo)
    if (isLegalAfterApply(b, m, side)) return true;
  return false;
}

}  // namespace cotuong::model
