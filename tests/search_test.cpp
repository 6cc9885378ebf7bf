#include <atomic>
#include <cassert>
#include <vector>

#include "cotuong/constants.hpp"
#include "cotuong/engine/bot_engine.hpp"
#include "cotuong/engine/config.hpp"
#include "cotuong/engine/engine.hpp"
#include "cotuong/model/game_state.hpp"
#include "cotuong/model/move_list.hpp"
#include "cotuong/model/notation.hpp"

using namespace cotuong;
using engine::SearchLimit;
using model::Move;

static core::Square sq(int row, int col) {
  return core::make_square(row, col);
}

static bool is_legal(const model::GameState& g, const Move& m) {
  for (const Move& l : g.legalMoves())
    if (l == m) return true;
  return false;
}

// True if the side to move can leave the opponent without a legal move within `moves`
// of its own moves, whatever the opponent replies.
static bool wins_within(const model::GameState& g, int moves) {
  for (const Move& m : g.legalMoves()) {
    model::GameState after = g;
    after.makeMove(m);
    const auto st = after.status();
    if (st == model::GameStatus::Checkmate || st == model::GameStatus::Stalemate) return true;
    if (moves <= 1 || st != model::GameStatus::Playing) continue;
    bool all = true;
    for (const Move& reply : after.legalMoves()) {
      model::GameState next = after;
      next.makeMove(reply);
      if (next.status() != model::GameStatus::Playing || !wins_within(next, moves - 1)) {
        all = false;
        break;
      }
    }
    if (all) return true;
  }
  return false;
}

int main() {
  engine::EngineConfig cfg;
  cfg.tt_size_mb = 8;

  // Same position, same depth, fresh engines: same answer
  {
    model::GameState g;
    engine::Engine a(cfg);
    engine::Engine b(cfg);
    const auto ma = a.find_best_move(g, SearchLimit::Depth(4));
    const auto mb = b.find_best_move(g, SearchLimit::Depth(4));
    assert(ma && mb);
    assert(*ma == *mb);
    assert(a.getLastSearchStats().bestScore == b.getLastSearchStats().bestScore);
    assert(a.getLastSearchStats().depth == 4);
    assert(a.getLastSearchStats().nodes > 0);
    assert(is_legal(g, *ma));
    assert(g.fen() == core::START_FEN);
  }

  // Mate in one is found and scored as such
  {
    model::GameState g("4k4/R8/9/9/8R/9/9/9/9/3K5 w");
    engine::Engine e(cfg);
    const auto best = e.find_best_move(g, SearchLimit::Depth(4));
    assert(best);
    assert(e.getLastSearchStats().bestScore == cfg.mate_score - 1);
    assert(!e.getLastSearchStats().bestPV.empty());
    assert(e.getLastSearchStats().bestPV.front() == *best);
    model::GameState after = g;
    after.makeMove(*best);
    assert(after.status() == model::GameStatus::Checkmate);

    // Excluded moves are never returned
    const Move mate(sq(5, 8), sq(9, 8));
    const auto other = e.find_best_move(g, SearchLimit::Depth(3), {mate});
    assert(other && !(*other == mate));
    assert(is_legal(g, *other));

    const model::MoveList all = g.legalMoves();
    const std::vector<Move> everything(all.begin(), all.end());
    const auto none = e.find_best_move(g, SearchLimit::Depth(3), everything);
    assert(!none);
  }

  // A longer forced mate scores lower by its distance
  {
    // the rooks take files 5 and 4 in turn; the red general holds file 3
    model::GameState g("9/9/4k4/9/9/9/8R/R8/9/3K5 w");
    assert(!wins_within(g, 1));
    assert(wins_within(g, 2));

    engine::Engine e(cfg);
    const auto best = e.find_best_move(g, SearchLimit::Depth(5));
    assert(best);
    const int score = e.getLastSearchStats().bestScore;
    assert(score == cfg.mate_score - 3);
    assert(score < cfg.mate_score - 1);

    // the chosen move keeps the mate in one
    model::GameState after = g;
    after.makeMove(*best);
    assert(after.status() == model::GameStatus::Playing);
    for (const Move& reply : after.legalMoves()) {
      model::GameState next = after;
      next.makeMove(reply);
      assert(wins_within(next, 1));
    }
  }

  // No legal move: no answer
  {
    model::GameState g("3k5/R8/9/9/9/9/9/9/9/4K4 b");
    const auto [best, stats] = engine::search(g, SearchLimit::Depth(3), cfg);
    assert(!best);
    assert(stats.depth == 0);
  }

  // Time limit
  {
    model::GameState g;
    engine::Engine e(cfg);
    const auto best = e.find_best_move(g, SearchLimit::Time(50));
    assert(best);
    assert(is_legal(g, *best));
    assert(e.getLastSearchStats().depth >= 1);
  }

  // A stop request before the first iteration still yields a legal move
  {
    model::GameState g;
    engine::Engine e(cfg);
    std::atomic<bool> stop{true};
    const auto best = e.find_best_move(g, SearchLimit::Depth(6), {}, &stop);
    assert(best);
    assert(is_legal(g, *best));
    assert(e.getLastSearchStats().stopped);
  }

  // Facade: depth and clock together
  {
    model::GameState g;
    engine::BotEngine bot(cfg);
    bot.setVerbose(false);
    const auto res = bot.findBestMove(g, 3, 0);
    assert(res.bestMove);
    assert(res.stats.depth == 3);
    assert(is_legal(g, *res.bestMove));
  }

  // newGame and a config change keep the engine usable
  {
    model::GameState g;
    engine::Engine e(cfg);
    assert(e.find_best_move(g, SearchLimit::Depth(2)));
    e.newGame();
    engine::EngineConfig other = cfg;
    other.tt_size_mb = 2;
    other.pruning_method = 2;
    e.setConfig(other);
    assert(e.getConfig().pruning_method == 2);
    const auto best = e.find_best_move(g, SearchLimit::Depth(3));
    assert(best && is_legal(g, *best));
  }

  return 0;
}
