#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/bitboard.hpp"
#include "move.hpp"

namespace cotuong::model {

class Board {
 public:
  Board();

  static Board startingPosition();

  void clear() noexcept;

  // Raw setup access. They skip move legality but keep bitboards, hash and score in sync.
  void setPiece(core::Square sq, bb::Piece p) noexcept;
  void addPiece(core::Square sq, bb::Piece p);  // throws InvalidStateError if occupied
  std::optional<bb::Piece> removePiece(core::Square sq) noexcept;
  std::optional<bb::Piece> getPiece(core::Square sq) const noexcept;

  bb::Bitboard getPieces(core::Color c) const { return m_color_occ[bb::ci(c)]; }
  bb::Bitboard getAllPieces() const { return m_all_occ; }
  bb::Bitboard getPieces(core::Color c, core::PieceType t) const {
    return m_bb[bb::ci(c)][bb::ti(t)];
  }

  // 9-bit occupancy of a row, 10-bit occupancy of a column (bit i = row i).
  std::uint16_t rowOccupancy(int row) const noexcept { return m_row_occ[row]; }
  std::uint16_t colOccupancy(int col) const noexcept { return m_col_occ[col]; }

  core::Square generalSquare(core::Color c) const noexcept {
    return bb::lsb(getPieces(c, core::PieceType::General));
  }

  [[nodiscard]] std::uint64_t hash() const noexcept { return m_hash; }
  // Material + piece-square sum for one side.
  [[nodiscard]] int score(core::Color c) const noexcept { return m_score[bb::ci(c)]; }

  // Moves the piece on mv.from, removing whatever stands on mv.to. Returns the removed
  // piece; that value is the undo token. Throws InvalidStateError if mv.from does not
  // hold a piece of `turn`.
  std::optional<bb::Piece> applyMove(const Move& mv, core::Color turn);
  void undoMove(const Move& mv, std::optional<bb::Piece> captured, core::Color turn) noexcept;

  // Pass: only the side-to-move key changes.
  void applyNullMove() noexcept { m_hash ^= sideKey(); }

  // Placement, hash and score equality; two boards with the same pieces compare equal.
  bool operator==(const Board& o) const noexcept;

 private:
  std::array<std::array<bb::Bitboard, core::PIECE_TYPE_NB>, 2> m_bb{};
  std::array<bb::Bitboard, 2> m_color_occ{};
  bb::Bitboard m_all_occ = 0;
  std::array<std::uint16_t, core::BOARD_ROWS> m_row_occ{};
  std::array<std::uint16_t, core::BOARD_COLS> m_col_occ{};

  // 0 = empty, otherwise (typeIndex + 1) | (color << 3)
  std::array<std::uint8_t, core::SQUARE_NB> m_piece_on{};

  std::uint64_t m_hash = 0;
  std::array<int, 2> m_score{};

  static std::uint64_t sideKey() noexcept;
  static inline std::uint8_t pack_piece(bb::Piece p) noexcept;
  static inline bb::Piece unpack_piece(std::uint8_t pp) noexcept;

  void place(core::Square sq, bb::Piece p) noexcept;
  void lift(core::Square sq, bb::Piece p) noexcept;
};

}  // namespace cotuong::model
