#pragma once
#include <cstdint>
namespace cotuong::core {
using Square = std::uint8_t;
constexpr Square NO_SQUARE = 90;
constexpr int BOARD_ROWS = 10;
constexpr int BOARD_COLS = 9;
constexpr int SQUARE_NB = BOARD_ROWS * BOARD_COLS;
enum class PieceType : std::uint8_t {
  General,
  Advisor,
  Elephant,
  Horse,
  Cannon,
  Rook,
  Soldier,
  None
};
constexpr int PIECE_TYPE_NB = 7;
enum class Color : std::uint8_t { Red = 0, Black = 1 };
constexpr inline core::Color operator~(core::Color c) {
  return c == core::Color::Red ? core::Color::Black : core::Color::Red;
}
constexpr inline int row_of(Square s) {
  return s / BOARD_COLS;
}
constexpr inline int col_of(Square s) {
  return s % BOARD_COLS;
}
constexpr inline Square make_square(int row, int col) {
  return static_cast<Square>(row * BOARD_COLS + col);
}
}  // namespace cotuong::core
