#pragma once
#include <array>

#include "../model/move.hpp"
#include "../xiangqi_types.hpp"

namespace cotuong::engine {

// Success counters per side, indexed [color][from][to].
using HistoryTable =
    std::array<std::array<std::array<int, core::SQUARE_NB>, core::SQUARE_NB>, 2>;

using KillerSlots = std::array<model::Move, 2>;

// descending insertion sort on parallel arrays
inline void sort_by_score_desc(int* score, model::Move* moves, int n) {
  for (int i = 1; i < n; ++i) {
    int s = score[i];
    model::Move m = moves[i];
    int j = i - 1;
    while (j >= 0 && score[j] < s) {
      score[j + 1] = score[j];
      moves[j + 1] = moves[j];
      --j;
    }
    score[j + 1] = s;
    moves[j + 1] = m;
  }
}

}  // namespace cotuong::engine
