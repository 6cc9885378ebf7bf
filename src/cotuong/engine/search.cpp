#include "cotuong/engine/search.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "cotuong/engine/lmr_red.hpp"
#include "cotuong/model/core/bitboard.hpp"

namespace cotuong::engine {

using core::Color;
using core::PieceType;
using model::Board;
using model::Move;

namespace {

constexpr int RFP_MARGIN = 120;
constexpr int FUTILITY_MARGIN = 150;
constexpr int DELTA_MARGIN = 200;
constexpr int ASPIRATION_DELTA = 50;

// ---- Guards ----

// Applies a pseudo-legal move, tracks its hash on the repetition path and undoes both
// on rollback or scope exit.
struct MoveUndoGuard {
  Board& board;
  std::vector<std::uint64_t>& path;
  Move move{};
  Color side = Color::Red;
  std::optional<model::bb::Piece> captured;
  bool applied = false;

  MoveUndoGuard(Board& b, std::vector<std::uint64_t>& p) : board(b), path(p) {}

  // Returns false when the move leaves the mover in check or the generals facing;
  // the move stays applied until rollback.
  bool doMove(const Move& m, Color s) {
    move = m;
    side = s;
    captured = board.applyMove(m, s);
    applied = true;
    path.push_back(board.hash());
    return !model::MoveGenerator::isInCheck(board, s) &&
           !model::MoveGenerator::isFlyingGeneral(board);
  }
  void rollback() noexcept {
    if (applied) {
      path.pop_back();
      board.undoMove(move, captured, side);
      applied = false;
    }
  }
  ~MoveUndoGuard() { rollback(); }
};

struct NullUndoGuard {
  Board& board;
  bool applied = false;
  explicit NullUndoGuard(Board& b) : board(b) {}
  void doNull() noexcept {
    board.applyNullMove();
    applied = true;
  }
  void rollback() noexcept {
    if (applied) {
      board.applyNullMove();
      applied = false;
    }
  }
  ~NullUndoGuard() { rollback(); }
};

// Null move is unsafe with only general, advisors, elephants and soldiers left (zugzwang).
bool has_major_pieces(const Board& b, Color side) {
  return model::bb::any(b.getPieces(side, PieceType::Rook) | b.getPieces(side, PieceType::Horse) |
                        b.getPieces(side, PieceType::Cannon));
}

}  // namespace

Search::Search(model::TranspositionTable& tt, const Evaluator& eval, const EngineConfig& cfg)
    : m_tt(tt), m_eval(eval), m_cfg(cfg), m_order(cfg) {}

void Search::clearSearchState() {
  for (auto& k : m_killers) k = KillerSlots{};
  for (auto& side : m_history)
    for (auto& row : side) row.fill(0);
}

void Search::age_history() noexcept {
  for (auto& side : m_history)
    for (auto& row : side)
      for (int& h : row) h /= 2;
}

int Search::encode_tt_score(int s, int ply) const noexcept {
  if (s >= m_cfg.mate_score - 2 * MAX_PLY) return s + ply;
  if (s <= -m_cfg.mate_score + 2 * MAX_PLY) return s - ply;
  return s;
}

int Search::decode_tt_score(int s, int ply) const noexcept {
  if (s >= m_cfg.mate_score - 2 * MAX_PLY) return s - ply;
  if (s <= -m_cfg.mate_score + 2 * MAX_PLY) return s + ply;
  return s;
}

bool Search::isRepetition() const noexcept {
  if (m_path.empty()) return false;
  const std::uint64_t h = m_path.back();
  int seen = 0;
  for (std::size_t i = 0; i + 1 < m_path.size(); ++i)
    if (m_path[i] == h) ++seen;
  return seen >= m_cfg.repetition_limit - 1;
}

// ---------------------------------------------------------------------------
// Quiescence: captures only, fail-hard.
// ---------------------------------------------------------------------------
int Search::quiescence(Board& b, Color turn, int alpha, int beta, int ply) {
  tick();
  const int standPat = m_eval.evaluate(b, turn);
  if (ply >= MAX_PLY - 1) return standPat;
  if (standPat >= beta) return beta;
  if (standPat > alpha) alpha = standPat;

  model::MoveList caps;
  m_order.generateCaptures(b, turn, caps);
  for (const Move& m : caps) {
    // delta pruning
    if (standPat + m_cfg.pieceValue(model::bb::ti(m.captured)) + DELTA_MARGIN < alpha) continue;

    MoveUndoGuard g(b, m_path);
    if (!g.doMove(m, turn)) continue;
    const int v = -quiescence(b, ~turn, -beta, -alpha, ply + 1);
    g.rollback();

    if (v >= beta) return beta;
    if (v > alpha) alpha = v;
  }
  return alpha;
}

// ---------------------------------------------------------------------------
// Negamax with PVS
// ---------------------------------------------------------------------------
int Search::negamax(Board& b, Color turn, int depth, int alpha, int beta, int ply,
                    const Move* excluded) {
  tick();
  if (ply >= MAX_PLY - 1) return m_eval.evaluate(b, turn);

  const bool inCheck = model::MoveGenerator::isInCheck(b, turn);
  if (depth <= 0) {
    if (!inCheck) return quiescence(b, turn, alpha, beta, ply);
    depth = 1;
  }

  // mate distance pruning
  alpha = std::max(alpha, mated_in(ply));
  beta = std::min(beta, mate_in(ply + 1));
  if (alpha >= beta) return alpha;

  const bool isPV = beta - alpha > 1;
  const int alphaOrig = alpha;
  const std::uint64_t key = b.hash();

  model::TTEntry tte{};
  bool haveTT = m_tt.probe_into(key, tte);
  Move ttMove = haveTT ? tte.best : Move{};
  const int ttValue = haveTT ? decode_tt_score(tte.value, ply) : 0;

  if (haveTT && !excluded && tte.depth >= depth) {
    if (tte.bound == model::Bound::Exact) return ttValue;
    if (tte.bound == model::Bound::Lower && ttValue >= beta) return ttValue;
    if (tte.bound == model::Bound::Upper && ttValue <= alpha) return ttValue;
  }

  const int staticEval = inCheck ? -INF : m_eval.evaluate(b, turn);
  const bool canPrune = !inCheck && !isPV && !excluded && std::abs(beta) < PRUNE_BOUND;

  // reverse futility
  if (canPrune && depth <= 3 && staticEval - RFP_MARGIN * depth >= beta)
    return staticEval - RFP_MARGIN * depth;

  // null move
  if (canPrune && depth >= 3 && staticEval >= beta && !m_wasNull[ply - 1] &&
      has_major_pieces(b, turn)) {
    NullUndoGuard ng(b);
    ng.doNull();
    m_wasNull[ply] = true;
    const int v = -negamax(b, ~turn, depth - 1 - m_cfg.null_move_reduction, -beta, -beta + 1,
                           ply + 1, nullptr);
    m_wasNull[ply] = false;
    ng.rollback();
    if (v >= beta) return is_mate_score(v) ? beta : v;
  }

  // ProbCut (capture-only)
  if (canPrune && depth >= m_cfg.probcut_depth) {
    const int rbeta = beta + m_cfg.probcut_margin;
    if (rbeta < PRUNE_BOUND) {
      model::MoveList caps;
      m_order.generateCaptures(b, turn, caps);
      for (const Move& m : caps) {
        if (staticEval + m_cfg.pieceValue(model::bb::ti(m.captured)) < rbeta) continue;
        MoveUndoGuard g(b, m_path);
        if (!g.doMove(m, turn)) continue;
        int v = -quiescence(b, ~turn, -rbeta, -rbeta + 1, ply + 1);
        if (v >= rbeta)
          v = -negamax(b, ~turn, std::max(1, depth - m_cfg.probcut_reduction), -rbeta,
                       -rbeta + 1, ply + 1, nullptr);
        g.rollback();
        if (v >= rbeta) return v;
      }
    }
  }

  // internal iterative deepening
  if (!haveTT && !excluded && depth >= 4) {
    negamax(b, turn, depth - 2, alpha, beta, ply, nullptr);
    if (m_tt.probe_into(key, tte)) ttMove = tte.best;
  }

  // singular extension for the TT move
  bool singular = false;
  if (!excluded && haveTT && !ttMove.isNull() && depth >= m_cfg.singular_extension_min_depth &&
      tte.bound != model::Bound::Upper && tte.depth >= depth - 3 &&
      std::abs(ttValue) < PRUNE_BOUND) {
    const int sBeta = ttValue - m_cfg.singular_extension_margin;
    const int v = negamax(b, turn, (depth - 1) / 2, sBeta - 1, sBeta, ply, &ttMove);
    singular = v < sBeta;
  }

  model::MoveList moves;
  m_order.generate(b, turn, ttMove, m_killers[ply], m_history, moves);

  const bool useFutility = m_cfg.pruning_method == 0 || m_cfg.pruning_method == 2;
  const bool useLmr = m_cfg.pruning_method == 1 || m_cfg.pruning_method == 2;
  const int dynamicLimit =
      8 + static_cast<int>(std::lround(depth * depth * m_cfg.pruning_multiplier));

  int best = -INF;
  Move bestMove{};
  int legal = 0;

  for (const Move& m : moves) {
    if (excluded && m == *excluded) continue;

    MoveUndoGuard g(b, m_path);
    if (!g.doMove(m, turn)) continue;
    ++legal;

    const bool givesCheck = model::MoveGenerator::isInCheck(b, ~turn);
    const bool quiet = !m.isCapture() && !givesCheck;
    const bool isKiller = m == m_killers[ply][0] || m == m_killers[ply][1];

    if (legal > 1 && !isPV && !inCheck && quiet && !isKiller && best > -PRUNE_BOUND) {
      // late move pruning
      if (depth <= 4 && legal > 8 + 5 * depth * depth) continue;
      if (useFutility) {
        if (legal > dynamicLimit) continue;
        if (depth <= 2 && staticEval + FUTILITY_MARGIN * depth <= alpha) continue;
      }
    }

    int value;
    if (isRepetition()) {
      value = 0;
    } else {
      int newDepth = depth - 1;
      if (givesCheck && ply < 2 * m_rootDepth)
        newDepth += 1;
      else if (singular && m == ttMove)
        newDepth += 1;

      if (legal == 1) {
        value = -negamax(b, ~turn, newDepth, -beta, -alpha, ply + 1, nullptr);
      } else {
        int r = 0;
        if (useLmr && quiet && !inCheck && !isKiller && depth >= 3 && legal >= 4) {
          r = lmr_red(depth, legal - 1);
          if (isPV) r = std::max(0, r - 1);
          r = std::min(r, newDepth - 1);
          r = std::max(r, 0);
        }
        value = -negamax(b, ~turn, newDepth - r, -alpha - 1, -alpha, ply + 1, nullptr);
        if (value > alpha && r > 0)
          value = -negamax(b, ~turn, newDepth, -alpha - 1, -alpha, ply + 1, nullptr);
        if (value > alpha && value < beta)
          value = -negamax(b, ~turn, newDepth, -beta, -alpha, ply + 1, nullptr);
      }
    }
    g.rollback();

    if (value > best) {
      best = value;
      bestMove = m;
    }
    if (value > alpha) alpha = value;
    if (alpha >= beta) {
      if (!m.isCapture()) {
        auto& k = m_killers[ply];
        if (!(k[0] == m)) {
          k[1] = k[0];
          k[0] = m;
        }
        int& h = m_history[model::bb::ci(turn)][m.from][m.to];
        h = std::min(h + depth * depth, m_cfg.score_history_max);
      }
      break;
    }
  }

  // Xiangqi: no legal move loses, in check or not.
  if (legal == 0) return mated_in(ply);

  if (!excluded) {
    const model::Bound bound = best >= beta          ? model::Bound::Lower
                               : best > alphaOrig    ? model::Bound::Exact
                                                     : model::Bound::Upper;
    m_tt.store(key, encode_tt_score(best, ply), static_cast<std::int16_t>(depth), bound, bestMove);
  }
  return best;
}

// ---------------------------------------------------------------------------
// Root
// ---------------------------------------------------------------------------
Search::RootResult Search::searchRootDepth(Board& b, Color turn, int depth, int alpha, int beta,
                                           std::vector<Move>& rootMoves) {
  int best = -INF;
  Move bestMove = rootMoves.front();

  for (std::size_t i = 0; i < rootMoves.size(); ++i) {
    const Move& m = rootMoves[i];
    MoveUndoGuard g(b, m_path);
    g.doMove(m, turn);  // root moves are legal
    const bool givesCheck = model::MoveGenerator::isInCheck(b, ~turn);
    const int newDepth = depth - 1 + (givesCheck ? 1 : 0);
    m_wasNull[0] = false;

    int v;
    if (isRepetition()) {
      v = 0;
    } else if (i == 0) {
      v = -negamax(b, ~turn, newDepth, -beta, -alpha, 1, nullptr);
    } else {
      v = -negamax(b, ~turn, newDepth, -alpha - 1, -alpha, 1, nullptr);
      if (v > alpha && v < beta) v = -negamax(b, ~turn, newDepth, -beta, -alpha, 1, nullptr);
    }
    g.rollback();

    if (v > best) {
      best = v;
      bestMove = m;
    }
    if (v > alpha) alpha = v;
    if (alpha >= beta) break;
  }
  return RootResult{best, bestMove};
}

std::vector<Move> Search::build_pv_from_tt(Board b, Color turn, int max_len) {
  std::vector<Move> pv;
  std::vector<std::uint64_t> seen;
  for (int i = 0; i < max_len; ++i) {
    const auto e = m_tt.probe(b.hash());
    if (!e || e->best.isNull()) break;
    if (std::find(seen.begin(), seen.end(), b.hash()) != seen.end()) break;
    const model::MoveList legal = m_rules.generateLegalMoves(b, turn);
    const auto it = std::find(legal.begin(), legal.end(), e->best);
    if (it == legal.end()) break;
    seen.push_back(b.hash());
    pv.push_back(*it);
    b.applyMove(*it, turn);
    turn = ~turn;
  }
  return pv;
}

void Search::finish_stats() {
  using namespace std::chrono;
  m_stats.nodes = m_nodes;
  m_stats.elapsedMs =
      static_cast<std::uint64_t>(duration_cast<milliseconds>(steady_clock::now() - m_start).count());
  m_stats.nps = m_stats.elapsedMs > 0 ? 1000.0 * static_cast<double>(m_nodes) /
                                            static_cast<double>(m_stats.elapsedMs)
                                      : static_cast<double>(m_nodes);
}

std::optional<Move> Search::searchRoot(const model::GameState& state, const SearchLimit& limit,
                                       const std::vector<Move>& excluded,
                                       const std::atomic<bool>* stop) {
  using namespace std::chrono;
  m_stats = SearchStats{};
  m_nodes = 0;
  m_stop = stop;
  m_start = steady_clock::now();
  m_hasDeadline = limit.timeMs > 0;
  m_deadline = m_start + milliseconds(limit.timeMs);
  m_wasNull.fill(false);
  for (auto& k : m_killers) k = KillerSlots{};
  age_history();

  Board b = state.getBoard();
  const Color turn = state.turn();
  m_path = state.positionHistory();

  // ordered, legal, minus the excluded ones
  Move ttMove{};
  if (const auto e = m_tt.probe(b.hash())) ttMove = e->best;
  model::MoveList ordered;
  m_order.generate(b, turn, ttMove, m_killers[0], m_history, ordered);
  std::vector<Move> rootMoves;
  for (const Move& m : ordered) {
    if (std::find(excluded.begin(), excluded.end(), m) != excluded.end()) continue;
    if (model::MoveGenerator::isLegalAfterApply(b, m, turn)) rootMoves.push_back(m);
  }

  if (rootMoves.empty()) {
    finish_stats();
    m_stop = nullptr;
    return std::nullopt;
  }

  const int maxD = std::clamp(limit.maxDepth, 1, MAX_DEPTH);
  Move lastBest = rootMoves.front();
  int lastScore = 0;

  try {
    for (int depth = 1; depth <= maxD; ++depth) {
      if (stop && stop->load(std::memory_order_relaxed)) {
        m_stats.stopped = true;
        break;
      }
      // soft limit: do not start an iteration that is unlikely to finish
      if (m_hasDeadline && depth > 1) {
        const auto spent = duration_cast<milliseconds>(steady_clock::now() - m_start).count();
        if (spent * 10 >= static_cast<long long>(limit.timeMs) * 6) break;
      }

      m_rootDepth = depth;
      int delta = ASPIRATION_DELTA;
      int alpha = -INF;
      int beta = INF;
      if (depth >= 3 && !is_mate_score(lastScore)) {
        alpha = lastScore - delta;
        beta = lastScore + delta;
      }

      RootResult r{};
      for (;;) {
        r = searchRootDepth(b, turn, depth, alpha, beta, rootMoves);
        if (r.score <= alpha && alpha > -INF) {
          delta += delta / 2;
          alpha = is_mate_score(r.score) ? -INF : std::max(-INF, r.score - delta);
          continue;
        }
        if (r.score >= beta && beta < INF) {
          delta += delta / 2;
          beta = is_mate_score(r.score) ? INF : std::min(INF, r.score + delta);
          continue;
        }
        break;
      }

      lastScore = r.score;
      lastBest = r.best;
      auto it = std::find(rootMoves.begin(), rootMoves.end(), r.best);
      if (it != rootMoves.end()) std::rotate(rootMoves.begin(), it, it + 1);

      if (excluded.empty())
        m_tt.store(b.hash(), encode_tt_score(r.score, 0), static_cast<std::int16_t>(depth),
                   model::Bound::Exact, r.best);

      m_stats.depth = depth;
      m_stats.bestScore = r.score;
      m_stats.bestMove = r.best;
      m_stats.bestPV.assign(1, r.best);
      {
        Board next = b;
        next.applyMove(r.best, turn);
        const auto tail = build_pv_from_tt(next, ~turn, 15);
        m_stats.bestPV.insert(m_stats.bestPV.end(), tail.begin(), tail.end());
      }
    }
  } catch (const SearchStoppedException&) {
    m_stats.stopped = true;
  }

  // Nothing finished: fall back to the best-ordered legal move.
  if (!m_stats.bestMove) {
    m_stats.bestMove = lastBest;
    m_stats.bestScore = lastScore;
    m_stats.bestPV.assign(1, lastBest);
  }

  finish_stats();
  m_stop = nullptr;
  return m_stats.bestMove;
}

}  // namespace cotuong::engine
