#include "cotuong/model/board.hpp"

#include <cassert>
#include <string>

#include "cotuong/errors.hpp"
#include "cotuong/model/piece_square.hpp"
#include "cotuong/model/zobrist.hpp"

namespace cotuong::model {

namespace {
using core::Color;
using core::PieceType;
using core::Square;

constexpr const char* kTypeName[core::PIECE_TYPE_NB] = {"general", "advisor", "elephant", "horse",
                                                        "cannon",  "rook",    "soldier"};
}  // namespace

Board::Board() {
  Zobrist::init();
  clear();
}

Board Board::startingPosition() {
  Board b;
  static constexpr PieceType kBackRank[9] = {PieceType::Rook,     PieceType::Horse,
                                             PieceType::Elephant, PieceType::Advisor,
                                             PieceType::General,  PieceType::Advisor,
                                             PieceType::Elephant, PieceType::Horse,
                                             PieceType::Rook};
  for (Color c : {Color::Red, Color::Black}) {
    const int back = c == Color::Red ? 0 : 9;
    const int cannons = c == Color::Red ? 2 : 7;
    const int soldiers = c == Color::Red ? 3 : 6;
    for (int col = 0; col < core::BOARD_COLS; ++col)
      b.setPiece(core::make_square(back, col), {kBackRank[col], c});
    b.setPiece(core::make_square(cannons, 1), {PieceType::Cannon, c});
    b.setPiece(core::make_square(cannons, 7), {PieceType::Cannon, c});
    for (int col = 0; col < core::BOARD_COLS; col += 2)
      b.setPiece(core::make_square(soldiers, col), {PieceType::Soldier, c});
  }
  return b;
}

void Board::clear() noexcept {
  for (auto& byColor : m_bb) byColor.fill(0);
  m_color_occ = {0, 0};
  m_all_occ = 0;
  m_row_occ.fill(0);
  m_col_occ.fill(0);
  m_piece_on.fill(0);
  m_hash = 0;
  m_score = {0, 0};
}

std::uint64_t Board::sideKey() noexcept {
  return Zobrist::side;
}

inline std::uint8_t Board::pack_piece(bb::Piece p) noexcept {
  if (p.isNone()) return 0;
  return static_cast<std::uint8_t>((bb::ti(p.type) + 1) | (bb::ci(p.color) << 3));
}

inline bb::Piece Board::unpack_piece(std::uint8_t pp) noexcept {
  if (pp == 0) return bb::Piece{};
  return bb::Piece{static_cast<PieceType>((pp & 0x7) - 1),
                   ((pp >> 3) & 1u) ? Color::Black : Color::Red};
}

// Square must be empty.
void Board::place(Square sq, bb::Piece p) noexcept {
  const int ci = bb::ci(p.color);
  const bb::Bitboard mask = bb::sq_bb(sq);
  m_bb[ci][bb::ti(p.type)] |= mask;
  m_color_occ[ci] |= mask;
  m_all_occ |= mask;
  m_row_occ[core::row_of(sq)] |= static_cast<std::uint16_t>(1u << core::col_of(sq));
  m_col_occ[core::col_of(sq)] |= static_cast<std::uint16_t>(1u << core::row_of(sq));
  m_piece_on[sq] = pack_piece(p);
  m_hash ^= Zobrist::pieceKey(p, sq);
  m_score[ci] += piece_square_score(p, sq);
}

// Square must hold p.
void Board::lift(Square sq, bb::Piece p) noexcept {
  const int ci = bb::ci(p.color);
  const bb::Bitboard mask = bb::sq_bb(sq);
  m_bb[ci][bb::ti(p.type)] &= ~mask;
  m_color_occ[ci] &= ~mask;
  m_all_occ &= ~mask;
  m_row_occ[core::row_of(sq)] &= static_cast<std::uint16_t>(~(1u << core::col_of(sq)));
  m_col_occ[core::col_of(sq)] &= static_cast<std::uint16_t>(~(1u << core::row_of(sq)));
  m_piece_on[sq] = 0;
  m_hash ^= Zobrist::pieceKey(p, sq);
  m_score[ci] -= piece_square_score(p, sq);
}

void Board::setPiece(Square sq, bb::Piece p) noexcept {
  if (m_piece_on[sq] == pack_piece(p)) return;
  if (m_piece_on[sq]) lift(sq, unpack_piece(m_piece_on[sq]));
  if (!p.isNone()) place(sq, p);
}

void Board::addPiece(Square sq, bb::Piece p) {
  if (m_piece_on[sq])
    throw InvalidStateError("addPiece: square " + std::to_string(sq) + " is occupied");
  if (!p.isNone()) place(sq, p);
}

std::optional<bb::Piece> Board::removePiece(Square sq) noexcept {
  const std::uint8_t packed = m_piece_on[sq];
  if (!packed) return std::nullopt;
  const bb::Piece p = unpack_piece(packed);
  lift(sq, p);
  return p;
}

std::optional<bb::Piece> Board::getPiece(Square sq) const noexcept {
  const std::uint8_t packed = m_piece_on[sq];
  if (!packed) return std::nullopt;
  return unpack_piece(packed);
}

std::optional<bb::Piece> Board::applyMove(const Move& mv, Color turn) {
  if (mv.from >= core::SQUARE_NB || mv.to >= core::SQUARE_NB)
    throw InvalidStateError("applyMove: square out of range");
  const std::uint8_t packed = m_piece_on[mv.from];
  if (!packed)
    throw InvalidStateError("applyMove: no piece on square " + std::to_string(mv.from));
  const bb::Piece mover = unpack_piece(packed);
  if (mover.color != turn)
    throw InvalidStateError(std::string("applyMove: ") + kTypeName[bb::ti(mover.type)] +
                            " on square " + std::to_string(mv.from) +
                            " does not belong to the side to move");

  std::optional<bb::Piece> captured;
  if (m_piece_on[mv.to]) {
    captured = unpack_piece(m_piece_on[mv.to]);
    lift(mv.to, *captured);
  }
  lift(mv.from, mover);
  place(mv.to, mover);
  m_hash ^= sideKey();
  return captured;
}

void Board::undoMove(const Move& mv, std::optional<bb::Piece> captured,
                     [[maybe_unused]] Color turn) noexcept {
  const bb::Piece mover = unpack_piece(m_piece_on[mv.to]);
  assert(!mover.isNone() && mover.color == turn && "undoMove: mover missing on target square");
  lift(mv.to, mover);
  place(mv.from, mover);
  if (captured) place(mv.to, *captured);
  m_hash ^= sideKey();
}

bool Board::operator==(const Board& o) const noexcept {
  return m_piece_on == o.m_piece_on && m_hash == o.m_hash && m_score == o.m_score;
}

}  // namespace cotuong::model
