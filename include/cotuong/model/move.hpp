#pragma once
#include <cstdint>
#include <type_traits>

#include "core/model_types.hpp"

namespace cotuong::model {

struct Move {
  core::Square from = 0;
  core::Square to = 0;
  // Type of the piece taken by this move, None for quiet moves. Filled in by the
  // generators and by GameState history; not part of move identity.
  core::PieceType captured = core::PieceType::None;

  constexpr Move() noexcept = default;
  constexpr Move(core::Square f, core::Square t,
                 core::PieceType cap = core::PieceType::None) noexcept
      : from(f), to(t), captured(cap) {}

  constexpr bool isNull() const noexcept { return from == to; }
  constexpr bool isCapture() const noexcept { return captured != core::PieceType::None; }
};

constexpr inline bool operator==(const Move& a, const Move& b) noexcept {
  return a.from == b.from && a.to == b.to;
}

static_assert(std::is_trivially_copyable_v<Move>, "Move must be trivially copyable");
static_assert(sizeof(Move) <= 4, "Move should stay tightly packed");

}  // namespace cotuong::model
