#pragma once
#include <array>
#include <cstdint>

#include "bitboard.hpp"

namespace cotuong::model {

// A stepping move whose path passes one intermediate square (horse leg, elephant eye).
struct BlockedStep {
  core::Square target;
  core::Square block;
};

template <typename T, int N>
struct StepList {
  std::array<T, N> items{};
  std::uint8_t count = 0;

  const T* begin() const noexcept { return items.data(); }
  const T* end() const noexcept { return items.data() + count; }
};

// Read-only lookup tables, built once per process by the first call to get().
class AttackTables {
 public:
  static const AttackTables& get();

  // Line tables: idx = position along the line, occ = occupancy bits of the line.
  // Rook mask contains every reachable square up to and including the first blocker.
  std::uint16_t rookLine(int idx, std::uint16_t occ) const noexcept { return m_rookLine[idx][occ]; }
  // Cannon mask contains only the capture squares (first piece behind the screen).
  std::uint16_t cannonLine(int idx, std::uint16_t occ) const noexcept {
    return m_cannonLine[idx][occ];
  }

  // Spread a 10-bit column mask onto column 0 of the board.
  bb::Bitboard fileSpread(std::uint16_t mask) const noexcept { return m_fileSpread[mask]; }

  const StepList<BlockedStep, 8>& horse(core::Square s) const noexcept { return m_horse[s]; }
  const StepList<BlockedStep, 4>& elephant(core::Square s) const noexcept { return m_elephant[s]; }
  bb::Bitboard advisor(core::Square s) const noexcept { return m_advisor[s]; }
  bb::Bitboard general(core::Square s) const noexcept { return m_general[s]; }
  bb::Bitboard soldier(core::Color c, core::Square s) const noexcept {
    return m_soldier[bb::ci(c)][s];
  }
  // Squares from which a soldier of color c attacks s.
  bb::Bitboard soldierAttackers(core::Color c, core::Square s) const noexcept {
    return m_soldierFrom[bb::ci(c)][s];
  }

 private:
  AttackTables();

  std::array<std::array<std::uint16_t, 1024>, 10> m_rookLine{};
  std::array<std::array<std::uint16_t, 1024>, 10> m_cannonLine{};
  std::array<bb::Bitboard, 1024> m_fileSpread{};

  std::array<StepList<BlockedStep, 8>, core::SQUARE_NB> m_horse{};
  std::array<StepList<BlockedStep, 4>, core::SQUARE_NB> m_elephant{};
  std::array<bb::Bitboard, core::SQUARE_NB> m_advisor{};
  std::array<bb::Bitboard, core::SQUARE_NB> m_general{};
  std::array<std::array<bb::Bitboard, core::SQUARE_NB>, 2> m_soldier{};
  std::array<std::array<bb::Bitboard, core::SQUARE_NB>, 2> m_soldierFrom{};
};

}  // namespace cotuong::model
