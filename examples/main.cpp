#include <iostream>

#include "cotuong/engine/config.hpp"
#include "cotuong/errors.hpp"
#include "cotuong/ucci/ucci.hpp"

// cotuong_cli [config.json]
int main(int argc, char** argv) {
  try {
    cotuong::engine::EngineConfig cfg;
    if (argc > 1) cfg = cotuong::engine::EngineConfig::fromFile(argv[1]);
    cotuong::UCCI ucci(cfg);
    return ucci.run();
  } catch (const cotuong::Error& e) {
    std::cerr << "[CLI] " << e.what() << "\n";
    return 1;
  }
}
