#pragma once
#include <array>
#include <cstddef>

namespace cotuong::engine {

constexpr int LMR_MAX_D = 63;  // depth index [0..63]
constexpr int LMR_MAX_M = 63;  // moves-searched index [0..63]

using LMRTable = std::array<std::array<int, LMR_MAX_M + 1>, LMR_MAX_D + 1>;

extern const LMRTable LMR_RED;

// Precomputed Late Move Reduction for a depth and the number of moves already searched.
constexpr int lmr_red(int depth, int moves) {
  return LMR_RED[depth > LMR_MAX_D ? LMR_MAX_D : depth][moves > LMR_MAX_M ? LMR_MAX_M : moves];
}

}  // namespace cotuong::engine
