#include "cotuong/model/notation.hpp"

#include <cctype>
#include <sstream>

#include "cotuong/errors.hpp"

namespace cotuong::model {

namespace {

using core::Color;
using core::PieceType;

bool charToPiece(char ch, bb::Piece& out) {
  const Color color = std::isupper(static_cast<unsigned char>(ch)) ? Color::Red : Color::Black;
  switch (std::tolower(static_cast<unsigned char>(ch))) {
    case 'k':
      out = {PieceType::General, color};
      return true;
    case 'a':
      out = {PieceType::Advisor, color};
      return true;
    case 'b':
    case 'e':
      out = {PieceType::Elephant, color};
      return true;
    case 'n':
    case 'h':
      out = {PieceType::Horse, color};
      return true;
    case 'r':
      out = {PieceType::Rook, color};
      return true;
    case 'c':
      out = {PieceType::Cannon, color};
      return true;
    case 'p':
      out = {PieceType::Soldier, color};
      return true;
    default:
      return false;
  }
}

}  // namespace

char pieceToChar(bb::Piece p) noexcept {
  static constexpr char kLetters[core::PIECE_TYPE_NB] = {'k', 'a', 'b', 'n', 'c', 'r', 'p'};
  if (p.isNone()) return '.';
  const char c = kLetters[bb::ti(p.type)];
  return p.color == Color::Red ? static_cast<char>(std::toupper(c)) : c;
}

ParsedPosition parseFen(std::string_view fen) {
  std::istringstream iss{std::string(fen)};
  std::string placement, side;
  iss >> placement >> side;
  if (placement.empty()) throw ParseError("position string is empty");
  if (side.empty()) throw ParseError("position string lacks the side-to-move token");

  ParsedPosition out;
  int row = core::BOARD_ROWS - 1;
  int col = 0;
  int rowsSeen = 1;
  int squares = 0;
  int generals[2] = {0, 0};

  for (char ch : placement) {
    if (ch == '/') {
      if (col != core::BOARD_COLS)
        throw ParseError("row " + std::to_string(row) + " has " + std::to_string(col) +
                         " squares, expected 9");
      if (++rowsSeen > core::BOARD_ROWS) throw ParseError("too many rows in position string");
      --row;
      col = 0;
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      const int n = ch - '0';
      if (n == 0) throw ParseError("empty run of length 0");
      col += n;
      squares += n;
    } else {
      bb::Piece p;
      if (!charToPiece(ch, p)) throw ParseError(std::string("invalid piece letter '") + ch + "'");
      if (col >= core::BOARD_COLS) throw ParseError("row " + std::to_string(row) + " overflows");
      if (p.type == PieceType::General && ++generals[bb::ci(p.color)] > 1)
        throw ParseError("more than one general per side");
      out.board.setPiece(core::make_square(row, col), p);
      ++col;
      ++squares;
    }
    if (col > core::BOARD_COLS) throw ParseError("row " + std::to_string(row) + " overflows");
  }
  if (col != core::BOARD_COLS)
    throw ParseError("row " + std::to_string(row) + " has " + std::to_string(col) +
                     " squares, expected 9");
  if (rowsSeen != core::BOARD_ROWS)
    throw ParseError("expected 10 rows, found " + std::to_string(rowsSeen));
  if (squares != core::SQUARE_NB)
    throw ParseError("position describes " + std::to_string(squares) + " squares, expected 90");

  if (side == "w" || side == "r")
    out.turn = Color::Red;
  else if (side == "b")
    out.turn = Color::Black;
  else
    throw ParseError("invalid side-to-move token '" + side + "'");

  // Hash convention: the side key is in while Black is to move.
  if (out.turn == Color::Black) out.board.applyNullMove();
  return out;
}

std::string toFen(const Board& b, Color turn) {
  std::string out;
  for (int row = core::BOARD_ROWS - 1; row >= 0; --row) {
    int empty = 0;
    for (int col = 0; col < core::BOARD_COLS; ++col) {
      const auto p = b.getPiece(core::make_square(row, col));
      if (!p) {
        ++empty;
        continue;
      }
      if (empty) {
        out += static_cast<char>('0' + empty);
        empty = 0;
      }
      out += pieceToChar(*p);
    }
    if (empty) out += static_cast<char>('0' + empty);
    if (row > 0) out += '/';
  }
  out += turn == Color::Red ? " w" : " b";
  return out;
}

std::string squareToString(core::Square s) {
  std::string out;
  out += static_cast<char>('a' + core::col_of(s));
  out += static_cast<char>('0' + core::row_of(s));
  return out;
}

std::string moveToString(const Move& m) {
  return squareToString(m.from) + squareToString(m.to);
}

Move parseMove(std::string_view text) {
  if (text.size() != 4) throw ParseError("move text must have 4 characters: '" +
                                         std::string(text) + "'");
  auto square = [&](char f, char r) {
    if (f < 'a' || f > 'i' || r < '0' || r > '9')
      throw ParseError("invalid square in move '" + std::string(text) + "'");
    return core::make_square(r - '0', f - 'a');
  };
  return Move(square(text[0], text[1]), square(text[2], text[3]));
}

}  // namespace cotuong::model
