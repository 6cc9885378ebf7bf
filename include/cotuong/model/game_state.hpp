#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "board.hpp"
#include "move.hpp"
#include "move_generator.hpp"
#include "move_list.hpp"

namespace cotuong::model {

enum class GameStatus : std::uint8_t { Playing, Checkmate, Stalemate, Draw };

struct MoveRecord {
  Move move{};
  bb::Piece captured{};        // type None if the move was quiet
  std::uint64_t hashBefore{};  // board hash before the move
};

static_assert(std::is_trivially_copyable_v<MoveRecord>, "MoveRecord should be POD");

constexpr int DEFAULT_REPETITION_LIMIT = 3;

class GameState {
 public:
  GameState();
  explicit GameState(std::string_view fen);  // throws ParseError

  void reset();
  // Replaces the position and clears history. Throws ParseError and leaves *this unchanged.
  void setPosition(std::string_view fen);

  // Validates against the legal move list, applies, records and updates the status.
  // Throws IllegalMoveError (state unchanged) if the game is over or no legal move matches.
  Move makeMove(core::Square from, core::Square to);
  Move makeMove(const Move& m) { return makeMove(m.from, m.to); }

  // Reverts the latest move. Throws InvalidStateError if there is none.
  void undoMove();

  const Board& getBoard() const noexcept { return m_board; }
  core::Color turn() const noexcept { return m_turn; }
  GameStatus status() const noexcept { return m_status; }
  // Checkmate only: the side that delivered mate.
  std::optional<core::Color> winner() const noexcept;
  bool isOver() const noexcept { return m_status != GameStatus::Playing; }

  const std::vector<MoveRecord>& history() const noexcept { return m_history; }
  const std::vector<std::uint64_t>& positionHistory() const noexcept { return m_positions; }

  // How often the current position (same side to move) has occurred, this one included.
  int repetitionCount() const noexcept;
  int repetitionLimit() const noexcept { return m_repetition_limit; }
  bool isRepetitionDraw() const noexcept { return repetitionCount() >= m_repetition_limit; }
  void setRepetitionLimit(int limit);

  MoveList legalMoves() const;
  bool inCheck() const noexcept { return MoveGenerator::isInCheck(m_board, m_turn); }
  std::string fen() const;

 private:
  void updateStatus();

  Board m_board;
  core::Color m_turn = core::Color::Red;
  GameStatus m_status = GameStatus::Playing;
  std::vector<MoveRecord> m_history;
  std::vector<std::uint64_t> m_positions;
  int m_repetition_limit = DEFAULT_REPETITION_LIMIT;
  MoveGenerator m_move_gen;
};

}  // namespace cotuong::model
