#include "cotuong/model/zobrist.hpp"

#include <mutex>

namespace cotuong::model {

std::uint64_t Zobrist::piece[2][core::PIECE_TYPE_NB][core::SQUARE_NB];
std::uint64_t Zobrist::side;

namespace {
// SplitMix64
inline std::uint64_t splitmix64(std::uint64_t& x) {
  std::uint64_t z = (x += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

std::once_flag g_once_init;
}  // namespace

void Zobrist::init(std::uint64_t seed) {
  auto next = [&]() {
    std::uint64_t v;
    do {
      v = splitmix64(seed);
    } while (v == 0);
    return v;
  };

  for (int c = 0; c < 2; ++c)
    for (int t = 0; t < core::PIECE_TYPE_NB; ++t)
      for (int s = 0; s < core::SQUARE_NB; ++s) piece[c][t][s] = next();

  side = next();
}

void Zobrist::init() {
  std::call_once(g_once_init, [] { Zobrist::init(0x75BCD15ULL); });
}

}  // namespace cotuong::model
