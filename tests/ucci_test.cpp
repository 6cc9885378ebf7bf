#include <cassert>
#include <sstream>
#include <string>

#include "cotuong/engine/config.hpp"
#include "cotuong/ucci/ucci.hpp"

using namespace cotuong;

static bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

static std::string session(const std::string& script) {
  engine::EngineConfig cfg;
  cfg.tt_size_mb = 4;
  UCCI ucci(cfg);
  std::istringstream in(script);
  std::ostringstream out;
  const int rc = ucci.run(in, out);
  assert(rc == 0);
  return out.str();
}

int main() {
  // Handshake, position with moves, search, board dump
  {
    const std::string out =
        session("ucci\nisready\nposition startpos moves b2e2\ngo depth 2\nd\nlegal\nquit\n");
    assert(contains(out, "id name Cotuong"));
    assert(contains(out, "ucciok"));
    assert(contains(out, "readyok"));
    assert(contains(out, "info depth 2"));
    assert(contains(out, "bestmove "));
    assert(contains(out, "fen rnbakabnr/9/1c5c1/p1p1p1p1p/9/9/P1P1P1P1P/4C2C1/9/RNBAKABNR b"));
    assert(contains(out, "legal "));
    assert(out.size() >= 4 && out.compare(out.size() - 4, 4, "bye\n") == 0);
    // bestmove comes before the board dump
    assert(out.find("bestmove ") < out.find("fen rnbakabnr"));
  }

  // A bad position command leaves the current game alone
  {
    const std::string out =
        session("position startpos moves b2e2\nposition startpos moves a0a9\nd\nquit\n");
    assert(contains(out, "fen rnbakabnr/9/1c5c1/p1p1p1p1p/9/9/P1P1P1P1P/4C2C1/9/RNBAKABNR b"));
  }

  // move, undo, eval and options
  {
    const std::string out =
        session("setoption name hashsize value 2\nmove h2e2\nundo\neval\nd\nquit\n");
    assert(contains(out, "eval 0"));
    assert(contains(out, "fen rnbakabnr/9/1c5c1/p1p1p1p1p/9/9/P1P1P1P1P/1C5C1/9/RNBAKABNR w"));
  }

  // Checkmated side has no move to offer
  {
    const std::string out = session("position fen 4k3R/R8/9/9/9/9/9/9/9/3K5 b\ngo depth 3\nquit\n");
    assert(contains(out, "nobestmove"));
  }

  // Input ending without quit still shuts down cleanly
  {
    const std::string out = session("position startpos\ngo depth 1\n");
    assert(contains(out, "bestmove "));
    assert(contains(out, "bye"));
  }

  return 0;
}
