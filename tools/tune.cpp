#include <iomanip>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "cotuong/constants.hpp"
#include "cotuong/engine/bot_engine.hpp"
#include "cotuong/engine/config.hpp"
#include "cotuong/errors.hpp"
#include "cotuong/model/game_state.hpp"

using namespace cotuong;

namespace {

struct Options {
  std::string configA;
  std::string configB;
  int games = 10;
  int depth = 4;
  int maxPlies = 200;
  int randomPlies = 4;  // random opening moves so the games differ
  unsigned seed = 12345;
  int repetitionLimit = 0;  // 0: the smaller of the two configs' limits
};

enum class Outcome { WinA, WinB, Draw };

engine::EngineConfig load_or_default(const std::string& path) {
  if (path.empty()) return engine::EngineConfig{};
  return engine::EngineConfig::fromFile(path);
}

Outcome play_game(engine::BotEngine& a, engine::BotEngine& b, bool aIsRed, int repetitionLimit,
                  const Options& opt, std::mt19937& rng) {
  model::GameState game(core::START_FEN);
  game.setRepetitionLimit(repetitionLimit);
  a.engine().newGame();
  b.engine().newGame();

  for (int ply = 0; ply < opt.maxPlies && !game.isOver(); ++ply) {
    if (ply < opt.randomPlies) {
      const auto moves = game.legalMoves();
      std::uniform_int_distribution<int> dist(0, moves.size() - 1);
      game.makeMove(moves[dist(rng)]);
      continue;
    }
    const bool redToMove = game.turn() == core::Color::Red;
    engine::BotEngine& side = (redToMove == aIsRed) ? a : b;
    const auto res = side.findBestMove(game, opt.depth, 0);
    if (!res.bestMove) break;
    game.makeMove(*res.bestMove);
  }

  if (game.status() == model::GameStatus::Checkmate ||
      game.status() == model::GameStatus::Stalemate) {
    // side to move has lost
    const bool redWon = game.turn() == core::Color::Black;
    return redWon == aIsRed ? Outcome::WinA : Outcome::WinB;
  }
  return Outcome::Draw;
}

}  // namespace

int main(int argc, char** argv) {
  Options opt;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--a" && i + 1 < argc) {
        opt.configA = argv[++i];
      } else if (arg == "--b" && i + 1 < argc) {
        opt.configB = argv[++i];
      } else if (arg == "--games" && i + 1 < argc) {
        opt.games = std::stoi(argv[++i]);
      } else if (arg == "--depth" && i + 1 < argc) {
        opt.depth = std::stoi(argv[++i]);
      } else if (arg == "--max-plies" && i + 1 < argc) {
        opt.maxPlies = std::stoi(argv[++i]);
      } else if (arg == "--random-plies" && i + 1 < argc) {
        opt.randomPlies = std::stoi(argv[++i]);
      } else if (arg == "--seed" && i + 1 < argc) {
        opt.seed = static_cast<unsigned>(std::stoul(argv[++i]));
      } else if (arg == "--repetition" && i + 1 < argc) {
        opt.repetitionLimit = std::stoi(argv[++i]);
      } else {
        std::cerr << "usage: cotuong_tune [--a cfg.json] [--b cfg.json] [--games N] [--depth D]"
                     " [--max-plies P] [--random-plies R] [--seed S] [--repetition L]\n"
                     "  the game's repetition limit is L, or the smaller of the two configs'"
                     " repetition_limit when L is not given\n";
        return 2;
      }
    }
  } catch (const std::logic_error& e) {
    std::cerr << "[Tune] bad number: " << e.what() << "\n";
    return 2;
  }

  engine::EngineConfig cfgA;
  engine::EngineConfig cfgB;
  try {
    cfgA = load_or_default(opt.configA);
    cfgB = load_or_default(opt.configB);
  } catch (const Error& e) {
    std::cerr << "[Tune] " << e.what() << "\n";
    return 1;
  }

  const int repetitionLimit = opt.repetitionLimit > 0
                                  ? opt.repetitionLimit
                                  : engine::sharedRepetitionLimit(cfgA, cfgB);
  if (repetitionLimit < 2) {
    std::cerr << "[Tune] repetition limit must be at least 2\n";
    return 2;
  }
  std::cout << "[Tune] repetition limit " << repetitionLimit << "\n";

  engine::BotEngine a(cfgA);
  engine::BotEngine b(cfgB);
  a.setVerbose(false);
  b.setVerbose(false);

  std::mt19937 rng(opt.seed);
  int wins = 0, losses = 0, draws = 0;
  for (int g = 0; g < opt.games; ++g) {
    const bool aIsRed = (g % 2) == 0;
    const Outcome o = play_game(a, b, aIsRed, repetitionLimit, opt, rng);
    if (o == Outcome::WinA)
      ++wins;
    else if (o == Outcome::WinB)
      ++losses;
    else
      ++draws;
    std::cout << "[Tune] game " << (g + 1) << "/" << opt.games << " A as "
              << (aIsRed ? "red" : "black") << ": "
              << (o == Outcome::WinA ? "A wins" : o == Outcome::WinB ? "B wins" : "draw") << "\n";
  }

  const double score = opt.games > 0 ? (wins + 0.5 * draws) / opt.games : 0.0;
  std::cout << "[Tune] A vs B: +" << wins << " -" << losses << " =" << draws << "  score "
            << std::fixed << std::setprecision(3) << score << "\n";
  return 0;
}
