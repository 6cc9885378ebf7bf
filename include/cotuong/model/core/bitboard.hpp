#pragma once
#include <bit>
#include <cstdint>

#include "model_types.hpp"

namespace cotuong::model::bb {

constexpr Bitboard ONE = 1;
constexpr Bitboard BOARD_MASK = (ONE << core::SQUARE_NB) - 1;

constexpr inline Bitboard sq_bb(core::Square s) {
  return ONE << s;
}

constexpr inline std::uint64_t lo64(Bitboard b) {
  return static_cast<std::uint64_t>(b);
}
constexpr inline std::uint64_t hi64(Bitboard b) {
  return static_cast<std::uint64_t>(b >> 64);
}

constexpr inline bool any(Bitboard b) {
  return b != 0;
}
constexpr inline bool none(Bitboard b) {
  return b == 0;
}

constexpr inline int popcount(Bitboard b) {
  return std::popcount(lo64(b)) + std::popcount(hi64(b));
}

inline core::Square lsb(Bitboard b) noexcept {
  if (b == 0) return core::NO_SQUARE;
  const std::uint64_t lo = lo64(b);
  if (lo) return static_cast<core::Square>(std::countr_zero(lo));
  return static_cast<core::Square>(64 + std::countr_zero(hi64(b)));
}

inline core::Square pop_lsb(Bitboard& b) {
  const core::Square s = lsb(b);
  if (s != core::NO_SQUARE) b &= b - 1;
  return s;
}

// Row r occupies bits [r*9, r*9+9).
constexpr inline Bitboard row_bb(int row) {
  return static_cast<Bitboard>(0x1FF) << (row * core::BOARD_COLS);
}

constexpr inline Bitboard col_bb(int col) {
  Bitboard b = 0;
  for (int r = 0; r < core::BOARD_ROWS; ++r) b |= sq_bb(core::make_square(r, col));
  return b;
}

// Red side of the river: rows 0..4.
constexpr Bitboard RED_HALF = (ONE << 45) - 1;
constexpr Bitboard BLACK_HALF = BOARD_MASK & ~RED_HALF;

constexpr inline Bitboard palace_bb(core::Color c) {
  Bitboard b = 0;
  const int r0 = c == core::Color::Red ? 0 : 7;
  for (int r = r0; r < r0 + 3; ++r)
    for (int col = 3; col <= 5; ++col) b |= sq_bb(core::make_square(r, col));
  return b;
}

constexpr inline bool in_palace(core::Color c, int row, int col) {
  if (col < 3 || col > 5) return false;
  return c == core::Color::Red ? (row >= 0 && row <= 2) : (row >= 7 && row <= 9);
}

constexpr inline bool on_own_side(core::Color c, int row) {
  return c == core::Color::Red ? row <= 4 : row >= 5;
}

}  // namespace cotuong::model::bb
