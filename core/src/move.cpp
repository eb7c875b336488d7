#include "shutbox/move.hpp"
#include <sstream>

namespace shutbox {

Move Move::from_tiles(std::initializer_list<int> tiles) {
  return from_tiles(std::vector<int>(tiles));
}

Move Move::from_tiles(const std::vector<int>& tiles) {
  Move m;
  for (int t : tiles) {
    if (!is_valid_tile(t)) {
      throw InvariantViolation("Move tile out of range: " + std::to_string(t));
    }
    if (m.mask & tile_bit(t)) {
      throw InvariantViolation("Move repeats tile " + std::to_string(t));
    }
    m.mask |= tile_bit(t);
  }
  return m;
}

int Move::size() const {
  int n = 0;
  for (int t = kMinTile; t <= kMaxTile; ++t) {
    if (mask & tile_bit(t)) ++n;
  }
  return n;
}

int Move::sum() const {
  int s = 0;
  for (int t = kMinTile; t <= kMaxTile; ++t) {
    if (mask & tile_bit(t)) s += t;
  }
  return s;
}

std::vector<int> Move::tiles() const {
  std::vector<int> out;
  for (int t = kMinTile; t <= kMaxTile; ++t) {
    if (mask & tile_bit(t)) out.push_back(t);
  }
  return out;
}

std::string Move::to_string() const {
  std::ostringstream oss;
  oss << "{";
  bool first = true;
  for (int t : tiles()) {
    if (!first) oss << ",";
    oss << t;
    first = false;
  }
  oss << "}";
  return oss.str();
}

int compare_tiles(const Move& a, const Move& b) {
  // Walk both ascending sequences in step; the first differing element
  // decides, and a proper prefix sorts first.
  int ta = kMinTile;
  int tb = kMinTile;
  while (true) {
    while (ta <= kMaxTile && !(a.mask & tile_bit(ta))) ++ta;
    while (tb <= kMaxTile && !(b.mask & tile_bit(tb))) ++tb;
    const bool a_done = ta > kMaxTile;
    const bool b_done = tb > kMaxTile;
    if (a_done || b_done) {
      if (a_done && b_done) return 0;
      return a_done ? -1 : 1;
    }
    if (ta != tb) return ta < tb ? -1 : 1;
    ++ta;
    ++tb;
  }
}

} // namespace shutbox
