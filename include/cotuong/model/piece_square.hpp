#pragma once
#include <array>

#include "core/model_types.hpp"

namespace cotuong::model {

// Built-in material, indexed by PieceType (General..Soldier).
constexpr std::array<int, core::PIECE_TYPE_NB> BASE_VALUE = {10000, 200, 200, 400, 450, 900, 100};

using PstTable = std::array<std::array<int, core::BOARD_COLS>, core::BOARD_ROWS>;

// Tables are from Red's point of view, row 0 = Red back rank. Black reads row 9 - r.
// clang-format off
constexpr PstTable PST_SOLDIER = {{
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    { 10,  10,  10,  10,  10,  10,  10,  10,  10},
    { 20,  20,  20,  20,  20,  20,  20,  20,  20},
    { 30,  30,  30,  30,  30,  30,  30,  30,  30},
    { 40,  40,  40,  40,  40,  40,  40,  40,  40},
    { 50,  50,  50,  50,  50,  50,  50,  50,  50},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
}};

constexpr PstTable PST_HORSE = {{
    {  0, -10,   0,   0,   0,   0,   0, -10,   0},
    {  0,   5,  15,   5,   5,   5,  15,   5,   0},
    {  5,   5,  10,  10,  10,  10,  10,   5,   5},
    {  5,  10,  15,  20,  20,  20,  15,  10,   5},
    {  5,  10,  15,  20,  20,  20,  15,  10,   5},
    {  5,  10,  20,  25,  25,  25,  20,  10,   5},
    {  5,  10,  20,  25,  25,  25,  20,  10,   5},
    {  5,  10,  10,  10,  10,  10,  10,  10,   5},
    {  0,   5,   5,   5,   5,   5,   5,   5,   0},
    {  0, -10,   0,   0,   0,   0,   0, -10,   0},
}};

constexpr PstTable PST_ROOK = {{
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,  10,   0,  10,   0,  10,   0,  10,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    { 10,  20,  20,  20,  20,  20,  20,  20,  10},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
}};

constexpr PstTable PST_CANNON = {{
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,  10,   0,   0,   0,   0,   0,  10,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
    { 10,  10,  10,  10,  10,  10,  10,  10,  10},
    { 10,  10,  10,  10,  10,  10,  10,  10,  10},
    {  0,   0,   0,   0,   0,   0,   0,   0,   0},
}};
// clang-format on

constexpr inline int pst_value(core::PieceType t, core::Color c, core::Square s) {
  const int row = c == core::Color::Red ? core::row_of(s) : 9 - core::row_of(s);
  const int col = core::col_of(s);
  switch (t) {
    case core::PieceType::Soldier:
      return PST_SOLDIER[row][col];
    case core::PieceType::Horse:
      return PST_HORSE[row][col];
    case core::PieceType::Rook:
      return PST_ROOK[row][col];
    case core::PieceType::Cannon:
      return PST_CANNON[row][col];
    default:
      return 0;
  }
}

// Material plus placement, as tracked incrementally by Board.
constexpr inline int piece_square_score(bb::Piece p, core::Square s) {
  return BASE_VALUE[bb::ti(p.type)] + pst_value(p.type, p.color, s);
}

}  // namespace cotuong::model
