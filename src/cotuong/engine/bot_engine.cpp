#include "cotuong/engine/bot_engine.hpp"

#include <chrono>
#include <iostream>
#include <string>

#include "cotuong/model/notation.hpp"

namespace cotuong::engine {

BotEngine::BotEngine(const EngineConfig& cfg) : m_engine(cfg) {}
BotEngine::~BotEngine() = default;

SearchResult BotEngine::findBestMove(const model::GameState& gameState, int maxDepth,
                                     int thinkMillis, std::atomic<bool>* externalCancel,
                                     const std::vector<model::Move>& excluded) {
  SearchResult res;

  SearchLimit limit;
  limit.maxDepth = maxDepth > 0 ? maxDepth : MAX_DEPTH;
  limit.timeMs = thinkMillis > 0 ? thinkMillis : 0;

  using steady_clock = std::chrono::steady_clock;
  const auto t0 = steady_clock::now();
  res.bestMove = m_engine.find_best_move(gameState, limit, excluded, externalCancel);
  const long long elapsedMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - t0).count();

  res.stats = m_engine.getLastSearchStats();

  if (!m_verbose) return res;

  // reason (for logging)
  std::string reason;
  if (!res.bestMove)
    reason = "no-legal-move";
  else if (externalCancel && externalCancel->load())
    reason = "external-cancel";
  else if (res.stats.stopped)
    reason = "timeout";
  else
    reason = "normal";

  std::cout << "[BotEngine] Search finished: depth=" << res.stats.depth << "/" << limit.maxDepth
            << " time=" << elapsedMs << "ms reason=" << reason << "\n";

  std::cout << "[BotEngine] info nodes=" << res.stats.nodes
            << " nps=" << static_cast<long long>(res.stats.nps) << " time=" << res.stats.elapsedMs
            << " bestScore=" << res.stats.bestScore;
  if (res.stats.bestMove.has_value())
    std::cout << " bestMove=" << model::moveToString(res.stats.bestMove.value());
  std::cout << "\n";

  if (!res.stats.bestPV.empty()) {
    std::cout << "[BotEngine] pv";
    for (const auto& mv : res.stats.bestPV) std::cout << " " << model::moveToString(mv);
    std::cout << "\n";
  }

  return res;
}

SearchStats BotEngine::getLastSearchStats() const {
  return m_engine.getLastSearchStats();
}

}  // namespace cotuong::engine
