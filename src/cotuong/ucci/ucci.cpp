#include "cotuong/ucci/ucci.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "cotuong/constants.hpp"
#include "cotuong/engine/eval.hpp"
#include "cotuong/errors.hpp"
#include "cotuong/model/notation.hpp"

namespace cotuong {

static std::vector<std::string> split_ws(const std::string& s) {
  std::istringstream iss(s);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static std::string extract_fen_after(const std::string& line) {
  auto pos = line.find("fen");
  if (pos == std::string::npos) return "";
  pos += 3;
  while (pos < line.size() && isspace((unsigned char)line[pos])) ++pos;
  auto moves_pos = line.find(" moves ", pos);
  if (moves_pos == std::string::npos) return line.substr(pos);
  return line.substr(pos, moves_pos - pos);
}

static int parse_int(const std::string& s) {
  try {
    return std::stoi(s);
  } catch (const std::logic_error&) {
    throw ParseError("expected a number, got '" + s + "'");
  }
}

UCCI::UCCI(const engine::EngineConfig& cfg) : m_cfg(cfg), m_bot(cfg) {
  m_bot.setVerbose(false);
  m_game.setRepetitionLimit(m_cfg.repetition_limit);
}

UCCI::~UCCI() {
  stopSearch();
}

void UCCI::say(const std::string& text) {
  std::lock_guard<std::mutex> lk(m_out_mutex);
  *m_out << text << "\n" << std::flush;
}

void UCCI::showOptions() {
  say("option hashsize type spin min 1 max 4096 default " + std::to_string(m_cfg.tt_size_mb));
  say("option repetition type spin min 2 max 10 default " +
      std::to_string(m_cfg.repetition_limit));
  say("option configfile type string default <empty>");
}

// Accepts "setoption <name> <value>" and "setoption name <name> value <value>".
void UCCI::setOption(const std::string& line) {
  auto tokens = split_ws(line);
  std::string name;
  std::string value;
  if (tokens.size() >= 2 && tokens[1] == "name") {
    for (size_t i = 2; i < tokens.size(); ++i) {
      if (tokens[i] == "value") {
        for (size_t j = i + 1; j < tokens.size(); ++j) value += (value.empty() ? "" : " ") + tokens[j];
        break;
      }
      name += (name.empty() ? "" : " ") + tokens[i];
    }
  } else if (tokens.size() >= 3) {
    name = tokens[1];
    value = tokens[2];
  }
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (name.empty()) throw ParseError("setoption: missing option name");

  engine::EngineConfig cfg = m_cfg;
  if (name == "hashsize" || name == "hash") {
    cfg.tt_size_mb = static_cast<std::size_t>(std::clamp(parse_int(value), 1, 4096));
  } else if (name == "repetition") {
    cfg.repetition_limit = std::clamp(parse_int(value), 2, 10);
  } else if (name == "configfile") {
    cfg = engine::EngineConfig::fromFile(value);
  } else {
    throw ParseError("setoption: unknown option '" + name + "'");
  }
  m_game.setRepetitionLimit(cfg.repetition_limit);
  m_cfg = cfg;
  m_bot.engine().setConfig(m_cfg);
}

// Builds the new game on the side; the current one stays if anything fails.
void UCCI::setPosition(const std::string& line) {
  model::GameState next;
  next.setRepetitionLimit(m_cfg.repetition_limit);
  if (line.find("startpos") != std::string::npos) {
    next.setPosition(core::START_FEN);
  } else if (line.find("fen") != std::string::npos) {
    next.setPosition(extract_fen_after(line));
  } else {
    throw ParseError("position: expected startpos or fen");
  }

  auto posMoves = line.find(" moves");
  if (posMoves != std::string::npos) {
    std::istringstream iss(line.substr(posMoves + 6));
    std::string text;
    while (iss >> text) next.makeMove(model::parseMove(text));
  }
  m_game = std::move(next);
}

void UCCI::startSearch(const std::string& line) {
  auto tokens = split_ws(line);
  int depth = 0;
  int movetime = 0;
  int timeLeft = -1;
  int inc = 0;
  int movestogo = 0;
  for (size_t i = 1; i < tokens.size(); ++i) {
    if (tokens[i] == "depth" && i + 1 < tokens.size())
      depth = parse_int(tokens[++i]);
    else if (tokens[i] == "movetime" && i + 1 < tokens.size())
      movetime = parse_int(tokens[++i]);
    else if (tokens[i] == "time" && i + 1 < tokens.size())
      timeLeft = parse_int(tokens[++i]);
    else if (tokens[i] == "increment" && i + 1 < tokens.size())
      inc = parse_int(tokens[++i]);
    else if (tokens[i] == "movestogo" && i + 1 < tokens.size())
      movestogo = parse_int(tokens[++i]);
  }

  int thinkMillis = 0;
  if (movetime > 0) {
    thinkMillis = movetime;
  } else if (timeLeft >= 0) {
    thinkMillis = (movestogo > 0 ? timeLeft / movestogo : timeLeft / 30) + inc;
    thinkMillis = std::max(1, thinkMillis);
  }
  if (depth <= 0 && thinkMillis == 0) depth = 8;

  stopSearch();
  m_cancel.store(false);
  model::GameState snapshot = m_game;
  m_worker = std::thread([this, snapshot, depth, thinkMillis]() {
    const auto res = m_bot.findBestMove(snapshot, depth, thinkMillis, &m_cancel);
    std::ostringstream info;
    info << "info depth " << res.stats.depth << " score " << res.stats.bestScore << " nodes "
         << res.stats.nodes << " time " << res.stats.elapsedMs;
    if (!res.stats.bestPV.empty()) {
      info << " pv";
      for (const auto& m : res.stats.bestPV) info << " " << model::moveToString(m);
    }
    say(info.str());
    say(res.bestMove ? "bestmove " + model::moveToString(*res.bestMove) : "nobestmove");
  });
}

void UCCI::stopSearch() {
  if (!m_worker.joinable()) return;
  m_cancel.store(true);
  m_worker.join();
  m_cancel.store(false);
}

void UCCI::printBoard() {
  const model::Board& b = m_game.getBoard();
  std::ostringstream os;
  for (int row = core::BOARD_ROWS - 1; row >= 0; --row) {
    os << row << "  ";
    for (int col = 0; col < core::BOARD_COLS; ++col) {
      const auto p = b.getPiece(core::make_square(row, col));
      os << (p ? model::pieceToChar(*p) : '.') << ' ';
    }
    os << "\n";
  }
  os << "   a b c d e f g h i\n";
  os << "fen " << m_game.fen() << "\n";
  os << "hash " << std::hex << b.hash() << std::dec;
  say(os.str());
}

int UCCI::run(std::istream& in, std::ostream& out) {
  m_out = &out;
  std::string line;

  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    auto tokens = split_ws(line);
    if (tokens.empty()) continue;
    const std::string& cmd = tokens[0];

    if (cmd == "quit") break;

    if (cmd == "stop") {
      stopSearch();
      continue;
    }
    if (cmd == "isready") {
      say("readyok");
      continue;
    }

    // Everything below reads or changes the game; let a running search finish first.
    if (m_worker.joinable()) m_worker.join();

    try {
      if (cmd == "ucci") {
        say("id name " + m_name + " " + m_version);
        say("id author Cotuong developers");
        showOptions();
        say("ucciok");
      } else if (cmd == "setoption") {
        setOption(line);
      } else if (cmd == "config" && tokens.size() >= 2) {
        const auto cfg = engine::EngineConfig::fromFile(tokens[1]);
        m_game.setRepetitionLimit(cfg.repetition_limit);
        m_cfg = cfg;
        m_bot.engine().setConfig(m_cfg);
      } else if (cmd == "ucinewgame" || cmd == "newgame") {
        m_bot.engine().newGame();
        m_game.reset();
      } else if (cmd == "position") {
        setPosition(line);
      } else if (cmd == "go") {
        startSearch(line);
      } else if (cmd == "move" && tokens.size() >= 2) {
        m_game.makeMove(model::parseMove(tokens[1]));
      } else if (cmd == "undo") {
        m_game.undoMove();
      } else if (cmd == "legal") {
        std::string list;
        for (const auto& m : m_game.legalMoves()) list += (list.empty() ? "" : " ") + model::moveToString(m);
        say("legal " + list);
      } else if (cmd == "eval") {
        engine::Evaluator ev(m_cfg);
        say("eval " + std::to_string(ev.evaluate(m_game.getBoard(), m_game.turn())));
      } else if (cmd == "d") {
        printBoard();
      } else {
        std::cerr << "[UCCI] unknown command: " << cmd << "\n";
      }
    } catch (const Error& e) {
      std::cerr << "[UCCI] error: " << e.what() << "\n";
    }
  }

  stopSearch();
  say("bye");
  return 0;
}

}  // namespace cotuong
