#include "shutbox/board.hpp"
#include <sstream>

namespace shutbox {

Board Board::from_open_tiles(std::initializer_list<int> tiles) {
  return from_open_mask(Move::from_tiles(tiles).mask);
}

Board Board::from_open_mask(std::uint16_t mask) {
  if (mask & ~kAllTilesMask) {
    throw InvariantViolation("Board mask has bits outside tiles 1..9");
  }
  Board b;
  b.open_ = mask;
  return b;
}

bool Board::is_open(int tile) const {
  if (!is_valid_tile(tile)) {
    throw InvariantViolation("Board::is_open tile out of range: " + std::to_string(tile));
  }
  return (open_ & tile_bit(tile)) != 0;
}

void Board::shut(const Move& m) {
  if (m.empty()) {
    throw InvariantViolation("Board::shut called with an empty move");
  }
  if (m.mask & ~kAllTilesMask) {
    throw InvariantViolation("Board::shut move has tiles outside 1..9");
  }
  const std::uint16_t already_shut = m.mask & ~open_;
  if (already_shut) {
    throw InvariantViolation("Board::shut " + m.to_string() + " on " + to_string() +
                             ": tile " + std::to_string(Move(already_shut).tiles().front()) +
                             " is already shut");
  }
  open_ = static_cast<std::uint16_t>(open_ & ~m.mask);
}

int Board::score() const {
  return Move(open_).sum();
}

int Board::tiles_closed() const {
  return kNumTiles - Move(open_).size();
}

std::vector<int> Board::open_tiles() const {
  return Move(open_).tiles();
}

std::string Board::to_string() const {
  std::ostringstream oss;
  oss << "[";
  for (int t = kMinTile; t <= kMaxTile; ++t) {
    if (t > kMinTile) oss << " ";
    if (open_ & tile_bit(t)) {
      oss << t;
    } else {
      oss << "_";
    }
  }
  oss << "]";
  return oss.str();
}

} // namespace shutbox
