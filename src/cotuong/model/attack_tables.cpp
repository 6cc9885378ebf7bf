#include "cotuong/model/core/attack_tables.hpp"

#include <memory>
#include <mutex>

#include "cotuong/model/core/coordinate.hpp"

namespace cotuong::model {

namespace {

using core::Color;
using core::make_square;
using core::Square;

std::once_flag g_tables_once;
std::unique_ptr<AttackTables> g_tables;

std::uint16_t build_rook_line(int idx, std::uint16_t occ, int len) {
  std::uint16_t mask = 0;
  for (int i = idx + 1; i < len; ++i) {
    mask |= static_cast<std::uint16_t>(1u << i);
    if (occ & (1u << i)) break;
  }
  for (int i = idx - 1; i >= 0; --i) {
    mask |= static_cast<std::uint16_t>(1u << i);
    if (occ & (1u << i)) break;
  }
  return mask;
}

// First piece after exactly one screen, in both directions.
std::uint16_t build_cannon_line(int idx, std::uint16_t occ, int len) {
  std::uint16_t mask = 0;
  bool screen = false;
  for (int i = idx + 1; i < len; ++i) {
    if (!(occ & (1u << i))) continue;
    if (screen) {
      mask |= static_cast<std::uint16_t>(1u << i);
      break;
    }
    screen = true;
  }
  screen = false;
  for (int i = idx - 1; i >= 0; --i) {
    if (!(occ & (1u << i))) continue;
    if (screen) {
      mask |= static_cast<std::uint16_t>(1u << i);
      break;
    }
    screen = true;
  }
  return mask;
}

}  // namespace

const AttackTables& AttackTables::get() {
  std::call_once(g_tables_once, [] { g_tables.reset(new AttackTables()); });
  return *g_tables;
}

AttackTables::AttackTables() {
  // Ranks have 9 squares, files 10; a file table covers both.
  for (int idx = 0; idx < 10; ++idx) {
    for (int occ = 0; occ < 1024; ++occ) {
      const int len = 10;
      m_rookLine[idx][occ] = build_rook_line(idx, static_cast<std::uint16_t>(occ), len);
      m_cannonLine[idx][occ] = build_cannon_line(idx, static_cast<std::uint16_t>(occ), len);
    }
  }

  for (int mask = 0; mask < 1024; ++mask) {
    bb::Bitboard b = 0;
    for (int r = 0; r < core::BOARD_ROWS; ++r)
      if (mask & (1 << r)) b |= bb::sq_bb(make_square(r, 0));
    m_fileSpread[mask] = b;
  }

  static constexpr int kHorse[8][4] = {
      // dr, dc, leg dr, leg dc
      {2, 1, 1, 0},  {2, -1, 1, 0},  {-2, 1, -1, 0}, {-2, -1, -1, 0},
      {1, 2, 0, 1},  {-1, 2, 0, 1},  {1, -2, 0, -1}, {-1, -2, 0, -1},
  };
  static constexpr int kDiag[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
  static constexpr int kOrtho[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

  for (int s = 0; s < core::SQUARE_NB; ++s) {
    const int r = core::row_of(static_cast<Square>(s));
    const int c = core::col_of(static_cast<Square>(s));

    auto& horse = m_horse[s];
    for (const auto& h : kHorse) {
      const int tr = r + h[0], tc = c + h[1];
      if (!core::Coordinate::valid(tr, tc)) continue;
      horse.items[horse.count++] = {make_square(tr, tc), make_square(r + h[2], c + h[3])};
    }

    // Elephants stay on the side of the river they start on.
    auto& ele = m_elephant[s];
    for (const auto& d : kDiag) {
      const int tr = r + 2 * d[0], tc = c + 2 * d[1];
      if (!core::Coordinate::valid(tr, tc)) continue;
      if ((r <= 4) != (tr <= 4)) continue;
      ele.items[ele.count++] = {make_square(tr, tc), make_square(r + d[0], c + d[1])};
    }

    // Advisor and general targets are limited to the palace of the origin.
    for (Color col : {Color::Red, Color::Black}) {
      if (!bb::in_palace(col, r, c)) continue;
      for (const auto& d : kDiag) {
        const int tr = r + d[0], tc = c + d[1];
        if (bb::in_palace(col, tr, tc)) m_advisor[s] |= bb::sq_bb(make_square(tr, tc));
      }
      for (const auto& d : kOrtho) {
        const int tr = r + d[0], tc = c + d[1];
        if (bb::in_palace(col, tr, tc)) m_general[s] |= bb::sq_bb(make_square(tr, tc));
      }
    }

    for (Color col : {Color::Red, Color::Black}) {
      const int fwd = col == Color::Red ? 1 : -1;
      bb::Bitboard t = 0;
      if (core::Coordinate::valid(r + fwd, c)) t |= bb::sq_bb(make_square(r + fwd, c));
      if (!bb::on_own_side(col, r)) {
        if (c > 0) t |= bb::sq_bb(make_square(r, c - 1));
        if (c < core::BOARD_COLS - 1) t |= bb::sq_bb(make_square(r, c + 1));
      }
      m_soldier[bb::ci(col)][s] = t;
    }
  }

  for (Color col : {Color::Red, Color::Black}) {
    for (int from = 0; from < core::SQUARE_NB; ++from) {
      bb::Bitboard t = m_soldier[bb::ci(col)][from];
      while (t) {
        const Square to = bb::pop_lsb(t);
        m_soldierFrom[bb::ci(col)][to] |= bb::sq_bb(static_cast<Square>(from));
      }
    }
  }
}

}  // namespace cotuong::model
