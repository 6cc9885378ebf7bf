#pragma once
#include <array>
#include <cassert>
#include <cstddef>

#include "move.hpp"

namespace cotuong::model {

constexpr int MAX_MOVES = 128;

// Fixed-capacity move buffer; lives on the stack in every generator and search frame.
class MoveList {
 public:
  void push(const Move& m) noexcept {
    assert(m_size < MAX_MOVES && "MoveList overflow");
    if (m_size < MAX_MOVES) m_moves[m_size++] = m;
  }
  void clear() noexcept { m_size = 0; }

  // Removes element i by moving the last one into its place.
  void swapRemove(int i) noexcept { m_moves[i] = m_moves[--m_size]; }

  int size() const noexcept { return m_size; }
  bool empty() const noexcept { return m_size == 0; }

  Move& operator[](int i) noexcept { return m_moves[i]; }
  const Move& operator[](int i) const noexcept { return m_moves[i]; }

  Move* data() noexcept { return m_moves.data(); }
  Move* begin() noexcept { return m_moves.data(); }
  Move* end() noexcept { return m_moves.data() + m_size; }
  const Move* begin() const noexcept { return m_moves.data(); }
  const Move* end() const noexcept { return m_moves.data() + m_size; }

  bool contains(const Move& m) const noexcept {
    for (int i = 0; i < m_size; ++i)
      if (m_moves[i] == m) return true;
    return false;
  }

 private:
  std::array<Move, MAX_MOVES> m_moves;
  int m_size = 0;
};

}  // namespace cotuong::model
