#pragma once
#include <cstdint>

#include "core/model_types.hpp"

namespace cotuong::model {

struct Zobrist {
  static std::uint64_t piece[2][core::PIECE_TYPE_NB][core::SQUARE_NB];
  static std::uint64_t side;

  // Fixed seed, deterministic across runs. Safe to call from several threads.
  static void init();

  static std::uint64_t pieceKey(bb::Piece p, core::Square s) noexcept {
    return piece[bb::ci(p.color)][bb::ti(p.type)][s];
  }

 private:
  static void init(std::uint64_t seed);
};

}  // namespace cotuong::model
