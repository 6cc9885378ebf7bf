#pragma once
#include <algorithm>

#include "board.hpp"
#include "core/attack_tables.hpp"
#include "core/bitboard.hpp"

namespace cotuong::model {

// ---------------- Slider lookups ----------------

inline bb::Bitboard rook_attacks(const AttackTables& t, const Board& b, core::Square s) noexcept {
  const int r = core::row_of(s), c = core::col_of(s);
  const bb::Bitboard rank = static_cast<bb::Bitboard>(t.rookLine(c, b.rowOccupancy(r)) & 0x1FF)
                            << (r * core::BOARD_COLS);
  const bb::Bitboard file = t.fileSpread(t.rookLine(r, b.colOccupancy(c))) << c;
  return rank | file;
}

inline bb::Bitboard cannon_captures(const AttackTables& t, const Board& b,
                                    core::Square s) noexcept {
  const int r = core::row_of(s), c = core::col_of(s);
  const bb::Bitboard rank = static_cast<bb::Bitboard>(t.cannonLine(c, b.rowOccupancy(r)))
                            << (r * core::BOARD_COLS);
  const bb::Bitboard file = t.fileSpread(t.cannonLine(r, b.colOccupancy(c))) << c;
  return rank | file;
}

// Empty squares a cannon can slide to.
inline bb::Bitboard cannon_quiets(const AttackTables& t, const Board& b, core::Square s) noexcept {
  return rook_attacks(t, b, s) & ~b.getAllPieces();
}

inline bb::Bitboard horse_targets(const AttackTables& t, const Board& b, core::Square s) noexcept {
  bb::Bitboard out = 0;
  const bb::Bitboard occ = b.getAllPieces();
  for (const auto& st : t.horse(s))
    if (!(occ & bb::sq_bb(st.block))) out |= bb::sq_bb(st.target);
  return out;
}

inline bb::Bitboard elephant_targets(const AttackTables& t, const Board& b,
                                     core::Square s) noexcept {
  bb::Bitboard out = 0;
  const bb::Bitboard occ = b.getAllPieces();
  for (const auto& st : t.elephant(s))
    if (!(occ & bb::sq_bb(st.block))) out |= bb::sq_bb(st.target);
  return out;
}

// ---------------- Attack query ----------------

// True if any piece of `by` could capture on `sq` (own pieces on sq are irrelevant).
inline bool attackedBy(const Board& b, core::Square sq, core::Color by) noexcept {
  const AttackTables& t = AttackTables::get();

  if (rook_attacks(t, b, sq) & b.getPieces(by, core::PieceType::Rook)) return true;
  if (cannon_captures(t, b, sq) & b.getPieces(by, core::PieceType::Cannon)) return true;
  if (t.soldierAttackers(by, sq) & b.getPieces(by, core::PieceType::Soldier)) return true;

  bb::Bitboard horses = b.getPieces(by, core::PieceType::Horse);
  const bb::Bitboard occ = b.getAllPieces();
  while (horses) {
    const core::Square h = bb::pop_lsb(horses);
    for (const auto& st : t.horse(h))
      if (st.target == sq && !(occ & bb::sq_bb(st.block))) return true;
  }

  // Palace pieces and elephants; steps are symmetric so the lookup runs from sq.
  if (t.advisor(sq) & b.getPieces(by, core::PieceType::Advisor)) return true;
  if (t.general(sq) & b.getPieces(by, core::PieceType::General)) return true;
  const bb::Bitboard elephants = b.getPieces(by, core::PieceType::Elephant);
  if (elephants) {
    for (const auto& st : t.elephant(sq))
      if ((elephants & bb::sq_bb(st.target)) && !(occ & bb::sq_bb(st.block))) return true;
  }
  return false;
}

// Both generals on one file with nothing between them.
inline bool generalsFacing(const Board& b) noexcept {
  const core::Square red = b.generalSquare(core::Color::Red);
  const core::Square black = b.generalSquare(core::Color::Black);
  if (red == core::NO_SQUARE || black == core::NO_SQUARE) return false;
  if (core::col_of(red) != core::col_of(black)) return false;
  const int lo = std::min(core::row_of(red), core::row_of(black));
  const int hi = std::max(core::row_of(red), core::row_of(black));
  const unsigned between = ((1u << hi) - 1u) & ~((1u << (lo + 1)) - 1u);
  return (b.colOccupancy(core::col_of(red)) & between) == 0;
}

}  // namespace cotuong::model
