#include "cotuong/engine/config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

#include "cotuong/errors.hpp"
#include "cotuong/xiangqi_types.hpp"

namespace cotuong::engine {

namespace {

namespace pt = boost::property_tree;

const std::pair<const char*, int EngineConfig::*> kIntFields[] = {
    {"val_pawn", &EngineConfig::val_pawn},
    {"val_advisor", &EngineConfig::val_advisor},
    {"val_elephant", &EngineConfig::val_elephant},
    {"val_horse", &EngineConfig::val_horse},
    {"val_cannon", &EngineConfig::val_cannon},
    {"val_rook", &EngineConfig::val_rook},
    {"val_king", &EngineConfig::val_king},
    {"hanging_piece_penalty", &EngineConfig::hanging_piece_penalty},
    {"king_exposed_cannon_penalty", &EngineConfig::king_exposed_cannon_penalty},
    {"king_cannon_mount_penalty", &EngineConfig::king_cannon_mount_penalty},
    {"king_escape_penalty", &EngineConfig::king_escape_penalty},
    {"mobility_weight", &EngineConfig::mobility_weight},
    {"mobility_cap", &EngineConfig::mobility_cap},
    {"defender_bonus", &EngineConfig::defender_bonus},
    {"structure_bonus", &EngineConfig::structure_bonus},
    {"score_hash_move", &EngineConfig::score_hash_move},
    {"score_capture_base", &EngineConfig::score_capture_base},
    {"score_killer_move", &EngineConfig::score_killer_move},
    {"score_history_max", &EngineConfig::score_history_max},
    {"pruning_method", &EngineConfig::pruning_method},
    {"probcut_depth", &EngineConfig::probcut_depth},
    {"probcut_margin", &EngineConfig::probcut_margin},
    {"probcut_reduction", &EngineConfig::probcut_reduction},
    {"singular_extension_min_depth", &EngineConfig::singular_extension_min_depth},
    {"singular_extension_margin", &EngineConfig::singular_extension_margin},
    {"null_move_reduction", &EngineConfig::null_move_reduction},
    {"mate_score", &EngineConfig::mate_score},
    {"repetition_limit", &EngineConfig::repetition_limit},
};

// Every numeric field is read as double so "200.0" is accepted for integer fields.
double read_number(const pt::ptree& tree, const char* name, double fallback) {
  const auto child = tree.get_child_optional(name);
  if (!child) return fallback;
  if (!child->empty()) throw ParseError(std::string("config field '") + name + "' is not a number");
  const auto v = child->get_value_optional<double>();
  if (!v) throw ParseError(std::string("config field '") + name + "' is not a number");
  return *v;
}

int read_int(const pt::ptree& tree, const char* name, int fallback) {
  const double v = read_number(tree, name, fallback);
  if (!(v > static_cast<double>(std::numeric_limits<int>::min()) - 1.0 &&
        v < static_cast<double>(std::numeric_limits<int>::max()) + 1.0))
    throw ParseError(std::string("config field '") + name + "' is out of range");
  return static_cast<int>(v);
}

void require(bool ok, const char* name, const std::string& what) {
  if (!ok) throw ParseError(std::string("config field '") + name + "' " + what);
}

// Values the rules and the search cannot work with.
void check_ranges(const EngineConfig& cfg) {
  require(cfg.repetition_limit >= 2, "repetition_limit", "must be at least 2");
  require(cfg.null_move_reduction >= 0, "null_move_reduction", "must not be negative");
  require(cfg.probcut_reduction >= 1, "probcut_reduction", "must be at least 1");
  require(cfg.mobility_cap >= 0, "mobility_cap", "must not be negative");
  require(cfg.singular_extension_min_depth >= 1, "singular_extension_min_depth",
          "must be at least 1");
  require(cfg.pruning_method >= 0 && cfg.pruning_method <= 2, "pruning_method",
          "must be 0, 1 or 2");
  require(cfg.pruning_multiplier >= 0.0, "pruning_multiplier", "must not be negative");
  require(cfg.mate_score > PRUNE_BOUND + 2 * MAX_PLY && cfg.mate_score < INF - 2 * MAX_PLY,
          "mate_score",
          "must lie between " + std::to_string(PRUNE_BOUND + 2 * MAX_PLY) + " and " +
              std::to_string(INF - 2 * MAX_PLY));
}

}  // namespace

EngineConfig EngineConfig::fromJson(std::string_view text) {
  pt::ptree tree;
  std::istringstream in{std::string(text)};
  try {
    pt::read_json(in, tree);
  } catch (const pt::json_parser_error& e) {
    throw ParseError(std::string("config JSON: ") + e.what());
  }

  EngineConfig cfg;
  for (const auto& [name, field] : kIntFields)
    cfg.*field = read_int(tree, name, cfg.*field);
  cfg.pruning_multiplier = read_number(tree, "pruning_multiplier", cfg.pruning_multiplier);

  const double tt = read_number(tree, "tt_size_mb", static_cast<double>(cfg.tt_size_mb));
  if (tt < 1.0) throw ParseError("config field 'tt_size_mb' must be at least 1");
  if (tt > 65536.0) throw ParseError("config field 'tt_size_mb' must be at most 65536");
  cfg.tt_size_mb = static_cast<std::size_t>(tt);
  check_ranges(cfg);
  return cfg;
}

EngineConfig EngineConfig::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ParseError("cannot open config file " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  EngineConfig cfg = fromJson(ss.str());
  std::cout << "[Config] loaded " << path << "\n";
  return cfg;
}

std::string EngineConfig::toJson() const {
  pt::ptree tree;
  for (const auto& [name, field] : kIntFields) tree.put(name, this->*field);
  tree.put("pruning_multiplier", pruning_multiplier);
  tree.put("tt_size_mb", tt_size_mb);
  std::ostringstream out;
  pt::write_json(out, tree);
  return out.str();
}

int EngineConfig::pieceValue(int pieceTypeIndex) const noexcept {
  switch (static_cast<core::PieceType>(pieceTypeIndex)) {
    case core::PieceType::General:
      return val_king;
    case core::PieceType::Advisor:
      return val_advisor;
    case core::PieceType::Elephant:
      return val_elephant;
    case core::PieceType::Horse:
      return val_horse;
    case core::PieceType::Cannon:
      return val_cannon;
    case core::PieceType::Rook:
      return val_rook;
    case core::PieceType::Soldier:
      return val_pawn;
    default:
      return 0;
  }
}

int sharedRepetitionLimit(const EngineConfig& a, const EngineConfig& b) noexcept {
  return std::min(a.repetition_limit, b.repetition_limit);
}

}  // namespace cotuong::engine
