#include <cassert>
#include <stdexcept>

#include "cotuong/model/core/attack_tables.hpp"
#include "cotuong/model/core/bitboard.hpp"
#include "cotuong/model/core/coordinate.hpp"

using namespace cotuong;
using model::AttackTables;

static core::Square sq(int row, int col) {
  return core::make_square(row, col);
}

template <typename List>
static bool has_target(const List& list, core::Square target, core::Square block) {
  for (const auto& st : list)
    if (st.target == target && st.block == block) return true;
  return false;
}

template <typename List>
static int count(const List& list) {
  int n = 0;
  for (const auto& st : list) {
    (void)st;
    ++n;
  }
  return n;
}

int main() {
  // Coordinates
  {
    core::Coordinate c(9, 8);
    assert(c.row() == 9 && c.col() == 8);
    assert(c.square() == 89);
    assert(core::Coordinate::fromSquare(40) == core::Coordinate(4, 4));

    bool threw = false;
    try {
      core::Coordinate bad(10, 0);
      (void)bad;
    } catch (const std::out_of_range&) {
      threw = true;
    }
    assert(threw);

    assert(!core::Coordinate::make(-1, 3));
    assert(!core::Coordinate::make(0, 9));
    assert(core::Coordinate::make(0, 0)->square() == 0);
  }

  // Bitboard helpers
  {
    using namespace model::bb;
    assert(popcount(BOARD_MASK) == 90);
    assert(popcount(row_bb(3)) == 9);
    assert(popcount(col_bb(8)) == 10);
    assert(lsb(sq_bb(77)) == 77);
    assert(lsb(Bitboard{0}) == core::NO_SQUARE);
    assert(popcount(palace_bb(core::Color::Red)) == 9);
    assert(in_palace(core::Color::Black, 8, 4));
    assert(!in_palace(core::Color::Black, 6, 4));
    assert(on_own_side(core::Color::Red, 4) && !on_own_side(core::Color::Red, 5));
    Bitboard b = sq_bb(3) | sq_bb(70);
    assert(pop_lsb(b) == 3);
    assert(pop_lsb(b) == 70);
    assert(b == 0);
  }

  const AttackTables& t = AttackTables::get();
  // same instance on every call
  assert(&t == &AttackTables::get());

  // Line tables
  {
    assert(t.rookLine(0, 0) == 0x3FE);
    // blockers on 0 and 5, slider on 4
    assert(t.rookLine(4, 0b100001) == 0b101111);
    // screen on 3, target on 6
    assert(t.cannonLine(0, (1u << 0) | (1u << 3) | (1u << 6)) == (1u << 6));
    // no screen, no capture
    assert(t.cannonLine(0, 1u << 0) == 0);
    assert(t.fileSpread(0b11) == (model::bb::sq_bb(sq(0, 0)) | model::bb::sq_bb(sq(1, 0))));
  }

  // Horse: edge square and leg blockers
  {
    const auto& h = t.horse(sq(0, 1));
    assert(count(h) == 3);
    assert(has_target(h, sq(2, 0), sq(1, 1)));
    assert(has_target(h, sq(2, 2), sq(1, 1)));
    assert(has_target(h, sq(1, 3), sq(0, 2)));
    assert(count(t.horse(sq(4, 4))) == 8);
  }

  // Elephant never crosses the river
  {
    const auto& e = t.elephant(sq(0, 2));
    assert(count(e) == 2);
    assert(has_target(e, sq(2, 0), sq(1, 1)));
    assert(has_target(e, sq(2, 4), sq(1, 3)));
    assert(count(t.elephant(sq(4, 2))) == 2);
    assert(count(t.elephant(sq(5, 2))) == 2);
    assert(has_target(t.elephant(sq(5, 2)), sq(7, 4), sq(6, 3)));
  }

  // Palace pieces
  {
    using model::bb::popcount;
    assert(popcount(t.advisor(sq(0, 3))) == 1);
    assert(popcount(t.advisor(sq(1, 4))) == 4);
    assert(popcount(t.advisor(sq(8, 4))) == 4);
    assert(popcount(t.general(sq(0, 4))) == 3);
    assert(popcount(t.general(sq(1, 4))) == 4);
    assert(popcount(t.general(sq(9, 3))) == 2);
  }

  // Soldiers: forward only until the river is crossed
  {
    using model::bb::popcount;
    using model::bb::sq_bb;
    assert(t.soldier(core::Color::Red, sq(3, 0)) == sq_bb(sq(4, 0)));
    assert(popcount(t.soldier(core::Color::Red, sq(5, 0))) == 2);
    assert(t.soldier(core::Color::Red, sq(9, 4)) == (sq_bb(sq(9, 3)) | sq_bb(sq(9, 5))));
    assert(t.soldier(core::Color::Black, sq(6, 0)) == sq_bb(sq(5, 0)));
    assert(popcount(t.soldier(core::Color::Black, sq(3, 4))) == 3);
    // a red soldier on (5,4) attacks (5,5)
    assert(t.soldierAttackers(core::Color::Red, sq(5, 5)) & sq_bb(sq(5, 4)));
    assert(!(t.soldierAttackers(core::Color::Red, sq(3, 5)) & sq_bb(sq(3, 4))));
  }

  return 0;
}
