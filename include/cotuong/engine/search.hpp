#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <vector>

#include "../model/game_state.hpp"
#include "../model/move_generator.hpp"
#include "../model/tt.hpp"
#include "config.hpp"
#include "engine_move_gen.hpp"
#include "eval.hpp"
#include "move_order.hpp"

namespace cotuong::engine {

struct SearchStoppedException : public std::exception {
  const char* what() const noexcept override { return "Search stopped"; }
};

// Fixed depth, a millisecond budget, or both; whichever triggers first ends the search.
struct SearchLimit {
  int maxDepth = MAX_DEPTH;
  int timeMs = 0;  // 0 = no clock

  static SearchLimit Depth(int d) { return SearchLimit{d, 0}; }
  static SearchLimit Time(int ms) { return SearchLimit{MAX_DEPTH, ms}; }
};

struct SearchStats {
  int depth = 0;  // last fully completed iteration
  std::uint64_t nodes = 0;
  double nps = 0.0;
  std::uint64_t elapsedMs = 0;
  int bestScore = 0;
  std::optional<model::Move> bestMove;
  std::vector<model::Move> bestPV;
  bool stopped = false;  // clock or cancel flag ended the search
};

// Single-threaded iterative deepening negamax. One instance per engine; the TT,
// killers and history are private to it.
class Search {
 public:
  Search(model::TranspositionTable& tt, const Evaluator& eval, const EngineConfig& cfg);
  ~Search() = default;

  Search(const Search&) = delete;
  Search& operator=(const Search&) = delete;
  Search(Search&&) = delete;
  Search& operator=(Search&&) = delete;

  // Best move among the legal root moves not listed in `excluded`, nullopt if none is left.
  // The move always comes from the last iteration that finished.
  std::optional<model::Move> searchRoot(const model::GameState& state, const SearchLimit& limit,
                                        const std::vector<model::Move>& excluded = {},
                                        const std::atomic<bool>* stop = nullptr);

  [[nodiscard]] const SearchStats& getStats() const noexcept { return m_stats; }
  void clearSearchState();  // killers and history

 private:
  struct RootResult {
    int score;
    model::Move best;
  };

  RootResult searchRootDepth(model::Board& b, core::Color turn, int depth, int alpha, int beta,
                             std::vector<model::Move>& rootMoves);
  int negamax(model::Board& b, core::Color turn, int depth, int alpha, int beta, int ply,
              const model::Move* excluded);
  int quiescence(model::Board& b, core::Color turn, int alpha, int beta, int ply);
  std::vector<model::Move> build_pv_from_tt(model::Board b, core::Color turn, int max_len = 16);

  // True if the position on top of m_path has now occurred often enough to be drawn.
  bool isRepetition() const noexcept;
  void age_history() noexcept;
  void finish_stats();

  static constexpr std::uint32_t TICK_STEP = 4096;

  inline void tick() {
    ++m_nodes;
    if ((m_nodes & (TICK_STEP - 1)) != 0) return;
    if (m_stop && m_stop->load(std::memory_order_relaxed)) throw SearchStoppedException();
    if (m_hasDeadline && std::chrono::steady_clock::now() >= m_deadline)
      throw SearchStoppedException();
  }

  int mate_in(int ply) const noexcept { return m_cfg.mate_score - ply; }
  int mated_in(int ply) const noexcept { return -m_cfg.mate_score + ply; }
  bool is_mate_score(int s) const noexcept {
    return s >= m_cfg.mate_score - 2 * MAX_PLY || s <= -m_cfg.mate_score + 2 * MAX_PLY;
  }
  int encode_tt_score(int s, int ply) const noexcept;
  int decode_tt_score(int s, int ply) const noexcept;

  model::TranspositionTable& m_tt;
  const Evaluator& m_eval;
  const EngineConfig& m_cfg;
  EngineMoveGen m_order;
  model::MoveGenerator m_rules;

  std::array<KillerSlots, MAX_PLY> m_killers{};
  HistoryTable m_history{};
  std::array<bool, MAX_PLY> m_wasNull{};

  // Hashes from the game start down to the current node, for repetition checks.
  std::vector<std::uint64_t> m_path;

  const std::atomic<bool>* m_stop = nullptr;
  bool m_hasDeadline = false;
  std::chrono::steady_clock::time_point m_start;
  std::chrono::steady_clock::time_point m_deadline;
  std::uint64_t m_nodes = 0;
  int m_rootDepth = 0;
  SearchStats m_stats;
};

}  // namespace cotuong::engine
