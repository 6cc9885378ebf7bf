#pragma once
#include <string>
#include <string_view>

#include "board.hpp"

namespace cotuong::model {

struct ParsedPosition {
  Board board;
  core::Color turn = core::Color::Red;
};

// Rows from Black's back rank (row 9) down to Red's (row 0), separated by '/', digits
// for empty runs, uppercase = Red. Trailing side token 'w' (Red) or 'b' (Black); any
// further fields are ignored. Throws ParseError; nothing is returned on failure.
ParsedPosition parseFen(std::string_view fen);
std::string toFen(const Board& b, core::Color turn);

char pieceToChar(bb::Piece p) noexcept;

// ICCS text: file letter a..i (column), rank digit 0..9 (row), e.g. "b2e2".
std::string squareToString(core::Square s);
std::string moveToString(const Move& m);
Move parseMove(std::string_view text);  // throws ParseError

}  // namespace cotuong::model
