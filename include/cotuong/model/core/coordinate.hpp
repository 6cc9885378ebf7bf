#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "../../xiangqi_types.hpp"

namespace cotuong::core {

// (row, col) on the 10x9 grid. Red's back rank is row 0.
class Coordinate {
 public:
  Coordinate(int row, int col) : m_row(row), m_col(col) {
    if (!valid(row, col))
      throw std::out_of_range("coordinate out of range: (" + std::to_string(row) + "," +
                              std::to_string(col) + ")");
  }

  static constexpr bool valid(int row, int col) noexcept {
    return row >= 0 && row < BOARD_ROWS && col >= 0 && col < BOARD_COLS;
  }

  static std::optional<Coordinate> make(int row, int col) noexcept {
    if (!valid(row, col)) return std::nullopt;
    return Coordinate(row, col, Unchecked{});
  }

  static Coordinate fromSquare(Square s) {
    return Coordinate(row_of(s), col_of(s));
  }

  int row() const noexcept { return m_row; }
  int col() const noexcept { return m_col; }
  Square square() const noexcept { return make_square(m_row, m_col); }

  bool operator==(const Coordinate&) const = default;

 private:
  struct Unchecked {};
  Coordinate(int row, int col, Unchecked) noexcept : m_row(row), m_col(col) {}

  int m_row;
  int m_col;
};

}  // namespace cotuong::core
