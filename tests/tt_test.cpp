#include <cassert>
#include <cstdint>

#include "cotuong/model/tt.hpp"

using namespace cotuong;
using model::Bound;
using model::Move;
using model::TranspositionTable;

int main() {
  // Slot count is a power of two
  {
    TranspositionTable tt(1);
    const std::size_t n = tt.slotCount();
    assert(n > 1);
    assert((n & (n - 1)) == 0);
  }

  // Store and probe
  {
    TranspositionTable tt(1);
    const std::uint64_t key = 0x123456789abcdefULL;
    assert(!tt.probe(key));
    tt.store(key, 42, 5, Bound::Lower, Move(3, 12));
    const auto e = tt.probe(key);
    assert(e);
    assert(e->value == 42);
    assert(e->depth == 5);
    assert(e->bound == Bound::Lower);
    assert(e->best == Move(3, 12));
  }

  // Keys sharing a slot: the newcomer replaces, the old key misses
  {
    TranspositionTable tt(1);
    const std::uint64_t a = 77;
    const std::uint64_t b = a + tt.slotCount();
    tt.store(a, 1, 10, Bound::Exact, Move(1, 2));
    assert(!tt.probe(b));
    tt.store(b, 2, 1, Bound::Upper, Move(4, 5));
    assert(!tt.probe(a));
    const auto e = tt.probe(b);
    assert(e && e->value == 2);
  }

  // Same position: shallower results do not replace deeper ones
  {
    TranspositionTable tt(1);
    const std::uint64_t key = 9999;
    tt.store(key, 10, 6, Bound::Exact, Move(1, 2));
    tt.store(key, 20, 3, Bound::Exact, Move(3, 4));
    assert(tt.probe(key)->value == 10);
    tt.store(key, 30, 6, Bound::Upper, Move(5, 6));
    assert(tt.probe(key)->value == 30);
    tt.store(key, 40, 8, Bound::Lower, Move(7, 8));
    assert(tt.probe(key)->depth == 8);
  }

  // clear and resize drop everything
  {
    TranspositionTable tt(1);
    tt.store(5, 1, 1, Bound::Exact, Move(1, 2));
    tt.clear();
    assert(!tt.probe(5));
    tt.store(5, 1, 1, Bound::Exact, Move(1, 2));
    tt.resize(2);
    assert(!tt.probe(5));
    assert(tt.slotCount() > 1);
  }

  return 0;
}
