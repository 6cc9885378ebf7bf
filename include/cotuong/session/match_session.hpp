#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../constants.hpp"
#include "../model/game_state.hpp"
#include "messages.hpp"

namespace cotuong::session {

// Relay and referee for one match between two remote players. Moves are forwarded to
// the opponent for verification and only committed to the authoritative GameState once
// the rules accept them and the peers' positions agree; any disagreement is settled by
// replaying the move locally and broadcasting the result.
//
// Not thread-safe: one instance per match, driven by a single caller.
class MatchSession {
 public:
  // Throws ParseError for a bad start position, InvalidStateError for a bad setup.
  MatchSession(PlayerId red, PlayerId black,
               int repetitionLimit = model::DEFAULT_REPETITION_LIMIT,
               const std::string& startFen = core::START_FEN);

  // Handles one message and returns what must be sent, in order.
  std::vector<Envelope> handle(const PlayerId& from, const ClientMessage& msg);

  const model::GameState& state() const noexcept { return m_state; }
  bool ended() const noexcept { return m_ended; }
  bool hasPendingMove() const noexcept { return m_pending.has_value(); }
  std::optional<core::Color> colorOf(const PlayerId& player) const;
  const PlayerId& playerOf(core::Color c) const noexcept {
    return c == core::Color::Red ? m_red : m_black;
  }

  void setVerbose(bool v) noexcept { m_verbose = v; }

 private:
  struct Pending {
    core::Color mover;
    model::Move move;
    std::string fen;
  };

  void onMakeMove(core::Color side, const MakeMove& msg, std::vector<Envelope>& out);
  void onVerifyMove(core::Color side, const VerifyMove& msg, std::vector<Envelope>& out);
  void onSurrender(core::Color side, std::vector<Envelope>& out);
  void onRequestDraw(core::Color side, std::vector<Envelope>& out);
  void onAcceptDraw(core::Color side, std::vector<Envelope>& out);

  void resolveConflict(const Pending& pending, std::vector<Envelope>& out);
  // Emits GameEnd if the authoritative position is terminal.
  void checkGameEnd(std::vector<Envelope>& out);
  void endGame(std::optional<core::Color> winner, const std::string& reason,
               std::vector<Envelope>& out);
  void broadcast(const ServerMessage& msg, std::vector<Envelope>& out) const;
  void sendError(const PlayerId& to, const std::string& text, std::vector<Envelope>& out) const;

  model::GameState m_state;
  PlayerId m_red;
  PlayerId m_black;
  std::optional<Pending> m_pending;
  std::optional<core::Color> m_draw_offer_by;
  bool m_ended = false;
  bool m_verbose = true;
};

}  // namespace cotuong::session
