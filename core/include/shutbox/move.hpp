#pragma once
#include "shutbox/types.hpp"
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace shutbox {

// A set of tiles shut together in one action.
struct Move {
  std::uint16_t mask = 0;

  Move() = default;
  explicit Move(std::uint16_t m) : mask(m) {}

  // Throws InvariantViolation on a tile outside [1,9] or a repeated tile.
  static Move from_tiles(std::initializer_list<int> tiles);
  static Move from_tiles(const std::vector<int>& tiles);

  bool empty() const { return mask == 0; }
  bool contains(int tile) const { return is_valid_tile(tile) && (mask & tile_bit(tile)) != 0; }
  int size() const;
  int sum() const;
  std::vector<int> tiles() const;  // ascending
  std::string to_string() const;   // "{1,2,4}"

  bool operator==(const Move& o) const { return mask == o.mask; }
  bool operator!=(const Move& o) const { return mask != o.mask; }
};

// Lexicographic comparison of the ascending tile sequences of a and b.
// Negative if a < b, zero if equal, positive if a > b.
int compare_tiles(const Move& a, const Move& b);

} // namespace shutbox
