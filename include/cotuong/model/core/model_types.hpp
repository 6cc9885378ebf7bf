#pragma once
#include <cstdint>

#include "../../xiangqi_types.hpp"

namespace cotuong::model::bb {

// 90 squares need more than 64 bits; bit i is square i (row * 9 + col).
using Bitboard = unsigned __int128;

struct Piece {
  core::PieceType type = core::PieceType::None;
  core::Color color = core::Color::Red;

  constexpr bool isNone() const { return type == core::PieceType::None; }
};

constexpr inline bool operator==(const Piece& a, const Piece& b) noexcept {
  return a.type == b.type && a.color == b.color;
}

constexpr inline int ci(core::Color c) noexcept {
  return static_cast<int>(c);
}
constexpr inline int ti(core::PieceType t) noexcept {
  return static_cast<int>(t);
}

}  // namespace cotuong::model::bb
