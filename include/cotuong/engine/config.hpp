#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace cotuong::engine {

struct EngineConfig {
  // Material (centipawn-like, soldier = 100)
  int val_pawn = 100;
  int val_advisor = 200;
  int val_elephant = 200;
  int val_horse = 400;
  int val_cannon = 450;
  int val_rook = 900;
  int val_king = 10000;

  // Evaluation terms
  int hanging_piece_penalty = 10;
  int king_exposed_cannon_penalty = 20;  // enemy cannon, nothing in between
  int king_cannon_mount_penalty = 10;    // enemy cannon with exactly one screen
  int king_escape_penalty = 15;          // per blocked palace square next to the general
  int mobility_weight = 10;
  int mobility_cap = 12;  // counted squares per piece
  int defender_bonus = 40;
  int structure_bonus = 15;

  // Move ordering
  int score_hash_move = 200000;
  int score_capture_base = 200000;
  int score_killer_move = 120000;
  int score_history_max = 80000;

  // 0: dynamic move limiting + futility, 1: LMR, 2: both
  int pruning_method = 1;
  double pruning_multiplier = 1.0;

  int probcut_depth = 5;
  int probcut_margin = 200;
  int probcut_reduction = 4;

  int singular_extension_min_depth = 8;
  int singular_extension_margin = 20;

  int null_move_reduction = 3;

  int mate_score = 300000;  // mate at ply p scores mate_score - p
  std::size_t tt_size_mb = 64;

  int repetition_limit = 3;

  // Missing keys keep their defaults, unknown keys are ignored. Throws ParseError on
  // malformed JSON, a value of the wrong kind, or a value the search cannot run with
  // (repetition_limit < 2, negative reductions, mate_score too close to the pruning bound).
  static EngineConfig fromJson(std::string_view text);
  static EngineConfig fromFile(const std::string& path);
  std::string toJson() const;

  int pieceValue(int pieceTypeIndex) const noexcept;
};

// Repetition limit for a game between engines using `a` and `b`: the stricter one.
int sharedRepetitionLimit(const EngineConfig& a, const EngineConfig& b) noexcept;

constexpr int MAX_PLY = 128;
constexpr int MAX_DEPTH = 64;
constexpr int INF = 1000000;
// |beta| below this keeps null move, ProbCut and reverse futility away from mate scores.
constexpr int PRUNE_BOUND = 15000;

}  // namespace cotuong::engine
