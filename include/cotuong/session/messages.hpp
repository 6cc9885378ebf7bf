#pragma once
#include <optional>
#include <string>
#include <variant>

#include "../model/move.hpp"
#include "../xiangqi_types.hpp"

namespace cotuong::session {

using PlayerId = std::string;

// ---- player -> session ----

// `fen` is the position the mover computed after the move.
struct MakeMove {
  model::Move move;
  std::string fen;
};

// The opponent's verdict on a relayed move, with the position it computed.
struct VerifyMove {
  std::string fen;
  bool valid = false;
};

struct Surrender {};
struct RequestDraw {};
struct AcceptDraw {};

using ClientMessage = std::variant<MakeMove, VerifyMove, Surrender, RequestDraw, AcceptDraw>;

// ---- session -> player ----

struct OpponentMove {
  model::Move move;
  std::string fen;
};

// Authoritative position after a disagreement between the peers.
struct GameStateCorrection {
  std::string fen;
  core::Color turn = core::Color::Red;
};

struct GameEnd {
  std::optional<core::Color> winner;  // empty for draws
  std::string reason;                 // Checkmate, Stalemate, Repetition, Surrender, Draw
};

struct DrawOffered {};

struct ErrorMessage {
  std::string text;
};

using ServerMessage =
    std::variant<OpponentMove, GameStateCorrection, GameEnd, DrawOffered, ErrorMessage>;

struct Envelope {
  PlayerId recipient;
  ServerMessage message;
};

}  // namespace cotuong::session
