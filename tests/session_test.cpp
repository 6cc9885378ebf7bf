#include <cassert>
#include <string>
#include <variant>
#include <vector>

#include "cotuong/constants.hpp"
#include "cotuong/errors.hpp"
#include "cotuong/model/notation.hpp"
#include "cotuong/session/match_session.hpp"

using namespace cotuong;
using namespace cotuong::session;
using core::Color;
using model::Move;

static core::Square sq(int row, int col) {
  return core::make_square(row, col);
}

static std::string fen_after(const model::GameState& g, const Move& m) {
  model::GameState next = g;
  next.makeMove(m);
  return next.fen();
}

// Move by `mover`, verified by `verifier` with the correct position.
static std::vector<Envelope> relay(MatchSession& s, const PlayerId& mover,
                                   const PlayerId& verifier, const Move& m) {
  const std::string fen = fen_after(s.state(), m);
  const auto sent = s.handle(mover, MakeMove{m, fen});
  assert(sent.size() == 1);
  assert(sent[0].recipient == verifier);
  assert(std::holds_alternative<OpponentMove>(sent[0].message));
  return s.handle(verifier, VerifyMove{fen, true});
}

template <class T>
static const T& only(const std::vector<Envelope>& out, const PlayerId& to) {
  assert(out.size() == 1);
  assert(out[0].recipient == to);
  const T* msg = std::get_if<T>(&out[0].message);
  assert(msg);
  return *msg;
}

int main() {
  // Relay, verification and commit
  {
    MatchSession s("alice", "bob");
    s.setVerbose(false);
    assert(s.colorOf("alice") == Color::Red);
    assert(s.colorOf("bob") == Color::Black);
    assert(!s.colorOf("carol"));

    const Move m = model::parseMove("b2e2");
    const std::string fen = fen_after(s.state(), m);
    const auto out = s.handle("alice", MakeMove{m, fen});
    const auto& om = only<OpponentMove>(out, "bob");
    assert(om.move == m);
    assert(om.fen == fen);
    assert(s.hasPendingMove());
    assert(s.state().fen() == core::START_FEN);

    // the mover cannot verify its own move
    only<ErrorMessage>(s.handle("alice", VerifyMove{fen, true}), "alice");
    assert(s.hasPendingMove());

    const auto done = s.handle("bob", VerifyMove{fen, true});
    assert(done.empty());
    assert(!s.hasPendingMove());
    assert(s.state().fen() == fen);
    assert(s.state().turn() == Color::Black);
  }

  // Out of turn, double move, unknown sender
  {
    MatchSession s("alice", "bob");
    s.setVerbose(false);
    const Move m = model::parseMove("h9g7");
    only<ErrorMessage>(s.handle("bob", MakeMove{m, "x"}), "bob");

    const Move r = model::parseMove("b2e2");
    s.handle("alice", MakeMove{r, fen_after(s.state(), r)});
    only<ErrorMessage>(s.handle("alice", MakeMove{r, "x"}), "alice");
    only<ErrorMessage>(s.handle("carol", Surrender{}), "carol");
  }

  // Peers disagree on the position: the legal move is applied and both are corrected
  {
    MatchSession s("alice", "bob");
    s.setVerbose(false);
    const Move m = model::parseMove("b2e2");
    const std::string good = fen_after(s.state(), m);
    s.handle("alice", MakeMove{m, good});
    const auto out = s.handle("bob", VerifyMove{core::START_FEN, true});
    assert(out.size() == 2);
    for (const auto& env : out) {
      const auto* c = std::get_if<GameStateCorrection>(&env.message);
      assert(c);
      assert(c->fen == good);
      assert(c->turn == Color::Black);
    }
    assert(out[0].recipient != out[1].recipient);
    assert(s.state().fen() == good);
  }

  // Rejected illegal move: position unchanged, mover still to play
  {
    MatchSession s("alice", "bob");
    s.setVerbose(false);
    const Move bad(sq(0, 0), sq(5, 0));  // rook through its own soldier
    s.handle("alice", MakeMove{bad, core::START_FEN});
    const auto out = s.handle("bob", VerifyMove{core::START_FEN, false});
    assert(out.size() == 2);
    const auto* c = std::get_if<GameStateCorrection>(&out[0].message);
    assert(c && c->fen == core::START_FEN && c->turn == Color::Red);
    assert(s.state().turn() == Color::Red);
    assert(!s.ended());

    // the mover plays again
    const auto again = relay(s, "alice", "bob", model::parseMove("h2e2"));
    assert(again.empty());
    assert(s.state().turn() == Color::Black);
  }

  // Surrender
  {
    MatchSession s("alice", "bob");
    s.setVerbose(false);
    const auto out = s.handle("bob", Surrender{});
    assert(out.size() == 2);
    for (const auto& env : out) {
      const auto* end = std::get_if<GameEnd>(&env.message);
      assert(end && end->reason == "Surrender" && end->winner == Color::Red);
    }
    assert(s.ended());
    only<ErrorMessage>(s.handle("alice", RequestDraw{}), "alice");
  }

  // Draw offer and acceptance
  {
    MatchSession s("alice", "bob");
    s.setVerbose(false);
    only<ErrorMessage>(s.handle("bob", AcceptDraw{}), "bob");
    only<DrawOffered>(s.handle("alice", RequestDraw{}), "bob");
    // the offering side cannot accept its own offer
    only<ErrorMessage>(s.handle("alice", AcceptDraw{}), "alice");
    const auto out = s.handle("bob", AcceptDraw{});
    assert(out.size() == 2);
    const auto* end = std::get_if<GameEnd>(&out[1].message);
    assert(end && end->reason == "Draw" && !end->winner);
    assert(s.ended());
  }

  // A committed move withdraws the offer
  {
    MatchSession s("alice", "bob");
    s.setVerbose(false);
    s.handle("alice", RequestDraw{});
    relay(s, "alice", "bob", model::parseMove("b2e2"));
    only<ErrorMessage>(s.handle("bob", AcceptDraw{}), "bob");
  }

  // Checkmate ends the match
  {
    MatchSession s("alice", "bob", model::DEFAULT_REPETITION_LIMIT,
                   "4k4/R8/9/9/8R/9/9/9/9/3K5 w");
    s.setVerbose(false);
    const auto out = relay(s, "alice", "bob", Move(sq(5, 8), sq(9, 8)));
    assert(out.size() == 2);
    for (const auto& env : out) {
      const auto* end = std::get_if<GameEnd>(&env.message);
      assert(end && end->reason == "Checkmate" && end->winner == Color::Red);
    }
    assert(s.ended());
  }

  // Repetition ends the match as a draw
  {
    MatchSession s("alice", "bob");
    s.setVerbose(false);
    const Move out1(sq(0, 0), sq(1, 0)), back1(sq(1, 0), sq(0, 0));
    const Move out2(sq(9, 0), sq(8, 0)), back2(sq(8, 0), sq(9, 0));
    std::vector<Envelope> last;
    for (int cycle = 0; cycle < 2; ++cycle) {
      assert(!s.ended());
      relay(s, "alice", "bob", out1);
      relay(s, "bob", "alice", out2);
      relay(s, "alice", "bob", back1);
      last = relay(s, "bob", "alice", back2);
    }
    assert(s.ended());
    assert(last.size() == 2);
    const auto* end = std::get_if<GameEnd>(&last[0].message);
    assert(end && end->reason == "Repetition" && !end->winner);
  }

  // Bad setups
  {
    bool threw = false;
    try {
      MatchSession s("alice", "alice");
    } catch (const InvalidStateError&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      MatchSession s("alice", "bob", 3, "3k5/R8/9/9/9/9/9/9/9/4K4 b");
    } catch (const InvalidStateError&) {
      threw = true;
    }
    assert(threw);
  }

  return 0;
}
