#include <cassert>
#include <string>
#include <vector>

#include "cotuong/constants.hpp"
#include "cotuong/errors.hpp"
#include "cotuong/model/board.hpp"
#include "cotuong/model/move_generator.hpp"
#include "cotuong/model/notation.hpp"
#include "cotuong/model/piece_square.hpp"

using namespace cotuong;
using core::Color;
using core::PieceType;
using model::bb::Piece;

static core::Square sq(int row, int col) {
  return core::make_square(row, col);
}

template <typename F>
static bool throws_parse_error(F&& f) {
  try {
    f();
  } catch (const ParseError&) {
    return true;
  }
  return false;
}

// Every square's piece must agree with the bitboards.
static void check_consistency(const model::Board& b) {
  model::bb::Bitboard all = 0;
  for (int s = 0; s < core::SQUARE_NB; ++s) {
    const auto p = b.getPiece(static_cast<core::Square>(s));
    const auto bit = model::bb::sq_bb(static_cast<core::Square>(s));
    if (p) {
      assert(b.getPieces(p->color, p->type) & bit);
      assert(b.getPieces(p->color) & bit);
      assert(!(b.getPieces(~p->color) & bit));
      all |= bit;
    } else {
      assert(!(b.getAllPieces() & bit));
    }
  }
  assert(all == b.getAllPieces());
}

int main() {
  // Starting layout
  {
    model::Board b = model::Board::startingPosition();
    check_consistency(b);
    assert(model::bb::popcount(b.getAllPieces()) == 32);
    assert(b.generalSquare(Color::Red) == sq(0, 4));
    assert(b.generalSquare(Color::Black) == sq(9, 4));
    assert(b.getPiece(sq(2, 1))->type == PieceType::Cannon);
    assert(b.getPiece(sq(6, 0))->color == Color::Black);
    assert(b.score(Color::Red) == b.score(Color::Black));
    assert(model::toFen(b, Color::Red) == core::START_FEN);
    assert(b.rowOccupancy(0) == 0x1FF);
    assert(b.colOccupancy(4) == ((1u << 0) | (1u << 3) | (1u << 6) | (1u << 9)));
  }

  // FEN round trip, including a mid-game position with black to move
  {
    const std::vector<std::string> fens = {
        core::START_FEN,
        "r1bakab1r/9/1cn3nc1/p1p1p1p1p/9/2P6/P3P1P1P/1C2C1N2/9/RNBAKAB1R b",
        "3k5/9/9/9/4r4/9/9/9/9/4K4 w",
    };
    for (const auto& fen : fens) {
      const auto parsed = model::parseFen(fen);
      check_consistency(parsed.board);
      assert(model::toFen(parsed.board, parsed.turn) == fen);
      const auto again = model::parseFen(model::toFen(parsed.board, parsed.turn));
      assert(again.board == parsed.board);
      assert(again.turn == parsed.turn);
    }
    // 'r' is accepted for Red, extra fields are ignored, alternate letters parse
    assert(model::parseFen("4k4/9/9/9/9/9/9/9/9/4K4 r").turn == Color::Red);
    assert(model::parseFen("4k4/9/9/9/9/9/9/9/9/4K4 b - - 0 1").turn == Color::Black);
    const auto alt = model::parseFen("4k4/9/9/9/9/9/9/9/4E4/4K4 w");
    assert(alt.board.getPiece(sq(1, 4))->type == PieceType::Elephant);
    assert(model::toFen(alt.board, alt.turn) == "4k4/9/9/9/9/9/9/9/4B4/4K4 w");
  }

  // Malformed notation
  {
    assert(throws_parse_error([] { model::parseFen(""); }));
    assert(throws_parse_error([] { model::parseFen("4k4/9/9/9/9/9/9/9/9/4K4"); }));
    assert(throws_parse_error([] { model::parseFen("4k4/9/9/9/9/9/9/9/4K4 w"); }));
    assert(throws_parse_error([] { model::parseFen("4k4/9/9/9/9/9/9/9/9/4K5 w"); }));
    assert(throws_parse_error([] { model::parseFen("4k4/9/9/9/9/9/9/9/9/4X4 w"); }));
    assert(throws_parse_error([] { model::parseFen("4k4/9/9/9/9/9/9/9/9/4K4 x"); }));
    assert(throws_parse_error([] { model::parseFen("3kk4/9/9/9/9/9/9/9/9/4K4 w"); }));
  }

  // Move text
  {
    const model::Move m = model::parseMove("b2e2");
    assert(m.from == sq(2, 1) && m.to == sq(2, 4));
    assert(model::moveToString(m) == "b2e2");
    assert(model::squareToString(sq(9, 8)) == "i9");
    assert(throws_parse_error([] { model::parseMove("b2e"); }));
    assert(throws_parse_error([] { model::parseMove("j0a0"); }));
  }

  // Central cannon: score changes by the piece-square delta only
  {
    model::Board b = model::Board::startingPosition();
    const model::Move m(sq(2, 1), sq(2, 4));
    model::MoveGenerator gen;
    const auto legal = gen.generateLegalMoves(b, Color::Red);
    assert(legal.contains(m));

    const int before = b.score(Color::Red);
    const int blackBefore = b.score(Color::Black);
    const std::uint64_t hashBefore = b.hash();
    const auto captured = b.applyMove(m, Color::Red);
    assert(!captured);
    const int delta = model::pst_value(PieceType::Cannon, Color::Red, sq(2, 4)) -
                      model::pst_value(PieceType::Cannon, Color::Red, sq(2, 1));
    assert(b.score(Color::Red) - before == delta);
    assert(b.score(Color::Black) == blackBefore);
    assert(b.hash() != hashBefore);
    check_consistency(b);
  }

  // Apply/undo restores everything, captures included
  {
    model::Board b = model::Board::startingPosition();
    const model::Board original = b;
    struct Step {
      model::Move move;
      Color side;
      std::optional<Piece> captured;
    };
    std::vector<Step> steps = {
        {model::Move(sq(2, 1), sq(2, 4)), Color::Red, {}},
        {model::Move(sq(7, 7), sq(7, 4)), Color::Black, {}},
        {model::Move(sq(2, 4), sq(6, 4)), Color::Red, {}},  // takes the soldier
        {model::Move(sq(9, 7), sq(7, 6)), Color::Black, {}},
    };
    for (auto& s : steps) {
      s.captured = b.applyMove(s.move, s.side);
      check_consistency(b);
    }
    assert(steps[2].captured && steps[2].captured->type == PieceType::Soldier);
    for (auto it = steps.rbegin(); it != steps.rend(); ++it) b.undoMove(it->move, it->captured, it->side);
    assert(b == original);
    assert(b.hash() == original.hash());
    assert(b.score(Color::Red) == original.score(Color::Red));
    assert(b.score(Color::Black) == original.score(Color::Black));
  }

  // Side-to-move key
  {
    const auto red = model::parseFen("4k4/9/9/9/9/9/9/9/9/4K4 w");
    const auto black = model::parseFen("4k4/9/9/9/9/9/9/9/9/4K4 b");
    assert(red.board.hash() != black.board.hash());
    model::Board b = red.board;
    b.applyNullMove();
    assert(b.hash() == black.board.hash());
    b.applyNullMove();
    assert(b.hash() == red.board.hash());
  }

  // applyMove rejects an empty or enemy origin and leaves the board untouched
  {
    model::Board b = model::Board::startingPosition();
    const model::Board original = b;
    bool threw = false;
    try {
      b.applyMove(model::Move(sq(4, 4), sq(5, 4)), Color::Red);
    } catch (const InvalidStateError&) {
      threw = true;
    }
    assert(threw);
    threw = false;
    try {
      b.applyMove(model::Move(sq(6, 0), sq(5, 0)), Color::Red);
    } catch (const InvalidStateError&) {
      threw = true;
    }
    assert(threw);
    assert(b == original);
  }

  // Raw setup keeps the invariants
  {
    model::Board b;
    b.addPiece(sq(0, 4), Piece{PieceType::General, Color::Red});
    b.addPiece(sq(9, 3), Piece{PieceType::General, Color::Black});
    b.setPiece(sq(5, 5), Piece{PieceType::Rook, Color::Red});
    check_consistency(b);
    bool threw = false;
    try {
      b.addPiece(sq(5, 5), Piece{PieceType::Horse, Color::Black});
    } catch (const InvalidStateError&) {
      threw = true;
    }
    assert(threw);
    const std::uint64_t withRook = b.hash();
    const auto removed = b.removePiece(sq(5, 5));
    assert(removed && removed->type == PieceType::Rook);
    assert(!b.removePiece(sq(5, 5)));
    assert(b.hash() != withRook);
    assert(b == model::parseFen("3k5/9/9/9/9/9/9/9/9/4K4 w").board);
    check_consistency(b);
  }

  return 0;
}
