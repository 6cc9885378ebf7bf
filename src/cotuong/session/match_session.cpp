#include "cotuong/session/match_session.hpp"

#include <iostream>
#include <utility>

#include "cotuong/errors.hpp"
#include "cotuong/model/notation.hpp"

namespace cotuong::session {

namespace {

// True if `fen` parses to exactly the position held by `state`, side to move included.
bool same_position(const std::string& fen, const model::GameState& state) {
  try {
    const model::ParsedPosition p = model::parseFen(fen);
    return p.turn == state.turn() && p.board == state.getBoard();
  } catch (const ParseError&) {
    return false;
  }
}

const char* color_name(core::Color c) {
  return c == core::Color::Red ? "red" : "black";
}

}  // namespace

MatchSession::MatchSession(PlayerId red, PlayerId black, int repetitionLimit,
                           const std::string& startFen)
    : m_state(startFen), m_red(std::move(red)), m_black(std::move(black)) {
  if (m_red == m_black) throw InvalidStateError("a match needs two distinct players");
  m_state.setRepetitionLimit(repetitionLimit);
  if (m_state.isOver()) throw InvalidStateError("start position is already decided");
}

std::optional<core::Color> MatchSession::colorOf(const PlayerId& player) const {
  if (player == m_red) return core::Color::Red;
  if (player == m_black) return core::Color::Black;
  return std::nullopt;
}

std::vector<Envelope> MatchSession::handle(const PlayerId& from, const ClientMessage& msg) {
  std::vector<Envelope> out;
  const auto side = colorOf(from);
  if (!side) {
    sendError(from, "not a player in this match", out);
    return out;
  }
  if (m_ended) {
    sendError(from, "game has ended", out);
    return out;
  }

  if (const auto* mm = std::get_if<MakeMove>(&msg))
    onMakeMove(*side, *mm, out);
  else if (const auto* vm = std::get_if<VerifyMove>(&msg))
    onVerifyMove(*side, *vm, out);
  else if (std::holds_alternative<Surrender>(msg))
    onSurrender(*side, out);
  else if (std::holds_alternative<RequestDraw>(msg))
    onRequestDraw(*side, out);
  else if (std::holds_alternative<AcceptDraw>(msg))
    onAcceptDraw(*side, out);
  return out;
}

void MatchSession::onMakeMove(core::Color side, const MakeMove& msg, std::vector<Envelope>& out) {
  if (side != m_state.turn()) {
    sendError(playerOf(side), "not your turn", out);
    return;
  }
  if (m_pending) {
    sendError(playerOf(side), "previous move is still awaiting verification", out);
    return;
  }

  m_pending = Pending{side, msg.move, msg.fen};
  if (m_verbose)
    std::cout << "[Session] " << color_name(side) << " played " << model::moveToString(msg.move)
              << ", waiting for verification\n";
  out.push_back(Envelope{playerOf(~side), OpponentMove{msg.move, msg.fen}});
}

void MatchSession::onVerifyMove(core::Color side, const VerifyMove& msg,
                                std::vector<Envelope>& out) {
  if (!m_pending) {
    sendError(playerOf(side), "no move to verify", out);
    return;
  }
  if (side == m_pending->mover) {
    sendError(playerOf(side), "a move is verified by the opponent", out);
    return;
  }

  const Pending pending = *m_pending;
  m_pending.reset();

  if (!msg.valid) {
    if (m_verbose) std::cout << "[Session] " << color_name(side) << " rejected the move\n";
    resolveConflict(pending, out);
    return;
  }

  // Replay on a copy; commit only if the rules accept it and both peers computed it.
  model::GameState next = m_state;
  try {
    next.makeMove(pending.move);
  } catch (const IllegalMoveError& e) {
    std::cerr << "[Session] verified move is illegal: " << e.what() << "\n";
    resolveConflict(pending, out);
    return;
  }
  if (!same_position(pending.fen, next) || !same_position(msg.fen, next)) {
    if (m_verbose) std::cout << "[Session] peers disagree on the position\n";
    resolveConflict(pending, out);
    return;
  }

  m_state = std::move(next);
  m_draw_offer_by.reset();
  checkGameEnd(out);
}

void MatchSession::resolveConflict(const Pending& pending, std::vector<Envelope>& out) {
  try {
    m_state.makeMove(pending.move);
    m_draw_offer_by.reset();
  } catch (const IllegalMoveError& e) {
    // Keep the position; the mover has to play again.
    if (m_verbose) std::cout << "[Session] move discarded: " << e.what() << "\n";
  }
  broadcast(GameStateCorrection{m_state.fen(), m_state.turn()}, out);
  checkGameEnd(out);
}

void MatchSession::onSurrender(core::Color side, std::vector<Envelope>& out) {
  m_pending.reset();
  endGame(~side, "Surrender", out);
}

void MatchSession::onRequestDraw(core::Color side, std::vector<Envelope>& out) {
  m_draw_offer_by = side;
  out.push_back(Envelope{playerOf(~side), DrawOffered{}});
}

void MatchSession::onAcceptDraw(core::Color side, std::vector<Envelope>& out) {
  if (!m_draw_offer_by || *m_draw_offer_by == side) {
    sendError(playerOf(side), "no draw offer to accept", out);
    return;
  }
  m_pending.reset();
  endGame(std::nullopt, "Draw", out);
}

void MatchSession::checkGameEnd(std::vector<Envelope>& out) {
  switch (m_state.status()) {
    case model::GameStatus::Playing:
      return;
    case model::GameStatus::Checkmate:
      endGame(~m_state.turn(), "Checkmate", out);
      return;
    case model::GameStatus::Stalemate:
      // stalemated side loses
      endGame(~m_state.turn(), "Stalemate", out);
      return;
    case model::GameStatus::Draw:
      endGame(std::nullopt, "Repetition", out);
      return;
  }
}

void MatchSession::endGame(std::optional<core::Color> winner, const std::string& reason,
                           std::vector<Envelope>& out) {
  m_ended = true;
  if (m_verbose) {
    std::cout << "[Session] game over: " << reason;
    if (winner) std::cout << ", winner " << color_name(*winner);
    std::cout << "\n";
  }
  broadcast(GameEnd{winner, reason}, out);
}

void MatchSession::broadcast(const ServerMessage& msg, std::vector<Envelope>& out) const {
  out.push_back(Envelope{m_red, msg});
  out.push_back(Envelope{m_black, msg});
}

void MatchSession::sendError(const PlayerId& to, const std::string& text,
                             std::vector<Envelope>& out) const {
  if (m_verbose) std::cerr << "[Session] error for " << to << ": " << text << "\n";
  out.push_back(Envelope{to, ErrorMessage{text}});
}

}  // namespace cotuong::session
