#pragma once
#include "shutbox/board.hpp"
#include "shutbox/dice.hpp"
#include "shutbox/move.hpp"
#include "shutbox/move_list.hpp"
#include <cstdint>

namespace shutbox {

struct Rules {
  // Every subset of the open tiles summing exactly to target, each once.
  // Ordered by tile count, then by ascending tile sequence. Throws
  // InvariantViolation if target is outside [2,12].
  static void legal_moves(std::uint16_t open_mask, int target, MoveList& out);
  static void legal_moves(const Board& b, int target, MoveList& out);
  static void legal_moves(const Board& b, const Roll& r, MoveList& out);

  static bool has_legal_move(const Board& b, int target);
  static bool is_legal(const Board& b, const Roll& r, const Move& m);

  // Number of distinct targets in [2,12] that still have at least one legal
  // move from this open set.
  static int reachable_targets(std::uint16_t open_mask);
};

} // namespace shutbox
