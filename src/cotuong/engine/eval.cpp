#include "cotuong/engine/eval.hpp"

#include <algorithm>
#include <bit>

#include "cotuong/model/core/attack_tables.hpp"
#include "cotuong/model/move_helper.hpp"
#include "cotuong/model/piece_square.hpp"

namespace cotuong::engine {

namespace {

using core::Color;
using core::PieceType;
using core::Square;
using model::AttackTables;
using model::Board;
namespace bb = model::bb;

inline int sign(Color c) {
  return c == Color::Red ? 1 : -1;
}

// Board tracks the built-in piece values; shift to the configured ones.
int material_correction(const Board& b, const EngineConfig& cfg) {
  int sc = 0;
  for (int t = 0; t < core::PIECE_TYPE_NB; ++t) {
    const int delta = cfg.pieceValue(t) - model::BASE_VALUE[t];
    if (!delta) continue;
    const auto pt = static_cast<PieceType>(t);
    sc += delta * (bb::popcount(b.getPieces(Color::Red, pt)) -
                   bb::popcount(b.getPieces(Color::Black, pt)));
  }
  return sc;
}

int mobility(const AttackTables& t, const Board& b, Color c, const EngineConfig& cfg) {
  const bb::Bitboard notOwn = ~b.getPieces(c) & bb::BOARD_MASK;
  int total = 0;
  auto count = [&](PieceType pt, auto targetsOf) {
    bb::Bitboard pieces = b.getPieces(c, pt);
    while (pieces) {
      const Square s = bb::pop_lsb(pieces);
      total += std::min(bb::popcount(targetsOf(s) & notOwn), cfg.mobility_cap);
    }
  };
  count(PieceType::Rook, [&](Square s) { return model::rook_attacks(t, b, s); });
  count(PieceType::Horse, [&](Square s) { return model::horse_targets(t, b, s); });
  count(PieceType::Cannon, [&](Square s) {
    return model::cannon_quiets(t, b, s) | (model::cannon_captures(t, b, s) & b.getPieces(~c));
  });
  count(PieceType::Soldier, [&](Square s) { return t.soldier(c, s); });
  return total * cfg.mobility_weight;
}

// Pieces strictly between two squares on one line, or -1 if they share no line.
int blockers_between(const Board& b, Square a, Square z) {
  const int ar = core::row_of(a), ac = core::col_of(a);
  const int zr = core::row_of(z), zc = core::col_of(z);
  unsigned occ;
  int lo, hi;
  if (ac == zc) {
    occ = b.colOccupancy(ac);
    lo = std::min(ar, zr);
    hi = std::max(ar, zr);
  } else if (ar == zr) {
    occ = b.rowOccupancy(ar);
    lo = std::min(ac, zc);
    hi = std::max(ac, zc);
  } else {
    return -1;
  }
  const unsigned between = ((1u << hi) - 1u) & ~((1u << (lo + 1)) - 1u);
  return std::popcount(occ & between);
}

// Penalty (positive number) for the general of color c.
int king_danger(const AttackTables& t, const Board& b, Color c, const EngineConfig& cfg) {
  const Square g = b.generalSquare(c);
  if (g == core::NO_SQUARE) return 0;
  int pen = 0;

  bb::Bitboard cannons = b.getPieces(~c, PieceType::Cannon);
  while (cannons) {
    const int n = blockers_between(b, g, bb::pop_lsb(cannons));
    if (n == 0)
      pen += cfg.king_exposed_cannon_penalty;
    else if (n == 1)
      pen += cfg.king_cannon_mount_penalty;
  }

  bb::Bitboard escapes = t.general(g);
  const bb::Bitboard own = b.getPieces(c);
  while (escapes) {
    const Square s = bb::pop_lsb(escapes);
    if ((own & bb::sq_bb(s)) || model::attackedBy(b, s, ~c)) pen += cfg.king_escape_penalty;
  }
  return pen;
}

int hanging(const Board& b, Color c, const EngineConfig& cfg) {
  if (!cfg.hanging_piece_penalty) return 0;
  int n = 0;
  bb::Bitboard pieces = b.getPieces(c) & ~b.getPieces(c, PieceType::General);
  while (pieces) {
    const Square s = bb::pop_lsb(pieces);
    if (model::attackedBy(b, s, ~c) && !model::attackedBy(b, s, c)) ++n;
  }
  return n * cfg.hanging_piece_penalty;
}

// Advisors and elephants: flat bonus each, plus a pair bonus when two of a kind guard each other.
int defenders(const AttackTables& t, const Board& b, Color c, const EngineConfig& cfg) {
  const bb::Bitboard adv = b.getPieces(c, PieceType::Advisor);
  const bb::Bitboard ele = b.getPieces(c, PieceType::Elephant);
  int sc = (bb::popcount(adv) + bb::popcount(ele)) * cfg.defender_bonus;

  if (bb::popcount(adv) == 2 && (t.advisor(bb::lsb(adv)) & adv)) sc += cfg.structure_bonus;
  if (bb::popcount(ele) == 2 && (model::elephant_targets(t, b, bb::lsb(ele)) & ele))
    sc += cfg.structure_bonus;
  return sc;
}

}  // namespace

int Evaluator::evaluateRed(const Board& b) const {
  const AttackTables& t = AttackTables::get();
  int score = b.score(Color::Red) - b.score(Color::Black);
  score += material_correction(b, m_cfg);

  for (Color c : {Color::Red, Color::Black}) {
    int side = mobility(t, b, c, m_cfg);
    side += defenders(t, b, c, m_cfg);
    side -= king_danger(t, b, c, m_cfg);
    side -= hanging(b, c, m_cfg);
    score += sign(c) * side;
  }
  return score;
}

int Evaluator::evaluate(const Board& b, Color turn) const {
  return sign(turn) * evaluateRed(b);
}

}  // namespace cotuong::engine
