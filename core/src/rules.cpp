#include "shutbox/rules.hpp"
#include <string>

namespace shutbox {

namespace {

// Extends `chosen` with `remaining` more tiles drawn in ascending order from
// `open`, starting at `first`, and emits every completion that hits target.
void collect_combinations(std::uint16_t open, int first, int remaining, int target,
                          std::uint16_t chosen, MoveList& out) {
  if (remaining == 0) {
    if (target == 0) out.push_back(Move(chosen));
    return;
  }
  for (int t = first; t <= kMaxTile; ++t) {
    // Tiles only grow from here on
    if (t > target) break;
    if (!(open & tile_bit(t))) continue;
    collect_combinations(open, t + 1, remaining - 1, target - t,
                         static_cast<std::uint16_t>(chosen | tile_bit(t)), out);
  }
}

} // namespace

void Rules::legal_moves(std::uint16_t open_mask, int target, MoveList& out) {
  out.clear();

  if (target < kMinTarget || target > kMaxTarget) {
    throw InvariantViolation("Rules::legal_moves target out of range: " + std::to_string(target));
  }

  const std::uint16_t open = open_mask & kAllTilesMask;
  const int open_count = Move(open).size();

  // Size-major order: all single tiles, then all pairs, and so on.
  for (int k = 1; k <= open_count; ++k) {
    collect_combinations(open, kMinTile, k, target, 0, out);
  }
}

void Rules::legal_moves(const Board& b, int target, MoveList& out) {
  legal_moves(b.open_mask(), target, out);
}

void Rules::legal_moves(const Board& b, const Roll& r, MoveList& out) {
  legal_moves(b.open_mask(), r.target(), out);
}

bool Rules::has_legal_move(const Board& b, int target) {
  MoveList moves;
  legal_moves(b, target, moves);
  return !moves.empty();
}

bool Rules::is_legal(const Board& b, const Roll& r, const Move& m) {
  if (m.empty()) return false;
  if ((m.mask & ~b.open_mask()) != 0) return false;
  return m.sum() == r.target();
}

int Rules::reachable_targets(std::uint16_t open_mask) {
  // Bit s of `sums` is set when some subset of the open tiles sums to s.
  std::uint64_t sums = 1;
  for (int t = kMinTile; t <= kMaxTile; ++t) {
    if (open_mask & tile_bit(t)) sums |= sums << t;
  }
  int count = 0;
  for (int s = kMinTarget; s <= kMaxTarget; ++s) {
    if (sums & (std::uint64_t{1} << s)) ++count;
  }
  return count;
}

} // namespace shutbox
