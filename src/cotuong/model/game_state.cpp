#include "cotuong/model/game_state.hpp"

#include <algorithm>

#include "cotuong/errors.hpp"
#include "cotuong/model/notation.hpp"

namespace cotuong::model {

GameState::GameState() {
  reset();
}

GameState::GameState(std::string_view fen) {
  setPosition(fen);
}

void GameState::reset() {
  m_board = Board::startingPosition();
  m_turn = core::Color::Red;
  m_history.clear();
  m_positions.assign(1, m_board.hash());
  m_status = GameStatus::Playing;
}

void GameState::setPosition(std::string_view fen) {
  ParsedPosition parsed = parseFen(fen);
  m_board = parsed.board;
  m_turn = parsed.turn;
  m_history.clear();
  m_positions.assign(1, m_board.hash());
  updateStatus();
}

void GameState::setRepetitionLimit(int limit) {
  if (limit < 2) throw InvalidStateError("repetition limit must be at least 2");
  m_repetition_limit = limit;
  if (m_status == GameStatus::Playing || m_status == GameStatus::Draw) updateStatus();
}

Move GameState::makeMove(core::Square from, core::Square to) {
  if (m_status != GameStatus::Playing)
    throw IllegalMoveError("game is over, no further moves accepted");
  if (from >= core::SQUARE_NB || to >= core::SQUARE_NB)
    throw IllegalMoveError("move square out of range");

  const MoveList legal = legalMoves();
  const Move wanted(from, to);
  const auto it = std::find(legal.begin(), legal.end(), wanted);
  if (it == legal.end())
    throw IllegalMoveError("illegal move " + moveToString(wanted) + " in " + fen());

  MoveRecord rec;
  rec.move = *it;
  rec.hashBefore = m_board.hash();
  const auto captured = m_board.applyMove(*it, m_turn);
  if (captured) rec.captured = *captured;

  m_history.push_back(rec);
  m_turn = ~m_turn;
  m_positions.push_back(m_board.hash());
  updateStatus();
  return rec.move;
}

void GameState::undoMove() {
  if (m_history.empty()) throw InvalidStateError("undoMove: no move to take back");
  const MoveRecord rec = m_history.back();
  m_history.pop_back();
  m_positions.pop_back();
  m_turn = ~m_turn;
  std::optional<bb::Piece> captured;
  if (!rec.captured.isNone()) captured = rec.captured;
  m_board.undoMove(rec.move, captured, m_turn);
  updateStatus();
}

std::optional<core::Color> GameState::winner() const noexcept {
  if (m_status == GameStatus::Checkmate) return ~m_turn;
  return std::nullopt;
}

int GameState::repetitionCount() const noexcept {
  return static_cast<int>(std::count(m_positions.begin(), m_positions.end(), m_board.hash()));
}

MoveList GameState::legalMoves() const {
  Board scratch = m_board;
  return m_move_gen.generateLegalMoves(scratch, m_turn);
}

std::string GameState::fen() const {
  return toFen(m_board, m_turn);
}

void GameState::updateStatus() {
  Board scratch = m_board;
  if (!m_move_gen.hasLegalMoves(scratch, m_turn)) {
    m_status = MoveGenerator::isInCheck(m_board, m_turn) ? GameStatus::Checkmate
                                                        : GameStatus::Stalemate;
  } else if (repetitionCount() >= m_repetition_limit) {
    m_status = GameStatus::Draw;
  } else {
    m_status = GameStatus::Playing;
  }
}

}  // namespace cotuong::model
