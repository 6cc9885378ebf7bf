#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "cotuong/engine/bot_engine.hpp"
#include "cotuong/engine/config.hpp"
#include "cotuong/model/game_state.hpp"

namespace cotuong {

// Line protocol driver (UCCI plus a few debugging commands). The search runs on a
// worker thread so that "stop" and "quit" are read while it thinks.
class UCCI {
 public:
  explicit UCCI(const engine::EngineConfig& cfg = {});
  ~UCCI();

  UCCI(const UCCI&) = delete;
  UCCI& operator=(const UCCI&) = delete;

  int run(std::istream& in = std::cin, std::ostream& out = std::cout);

 private:
  void showOptions();
  void setOption(const std::string& line);
  void setPosition(const std::string& line);
  void startSearch(const std::string& line);
  void stopSearch();
  void printBoard();
  void say(const std::string& text);

  engine::EngineConfig m_cfg;
  engine::BotEngine m_bot;
  model::GameState m_game;

  std::ostream* m_out = &std::cout;
  std::mutex m_out_mutex;
  std::thread m_worker;
  std::atomic<bool> m_cancel{false};

  std::string m_name = "Cotuong";
  std::string m_version = "1.0";
};

}  // namespace cotuong
