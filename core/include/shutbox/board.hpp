#pragma once
#include "shutbox/types.hpp"
#include "shutbox/move.hpp"
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace shutbox {

// Open/shut state of tiles 1..9. The tile set never changes, only the flags.
class Board {
public:
  Board() = default;

  // Position with exactly the given tiles open.
  static Board from_open_tiles(std::initializer_list<int> tiles);
  static Board from_open_mask(std::uint16_t mask);

  bool is_open(int tile) const;

  // Shuts every tile of m. Throws InvariantViolation (board untouched) if m
  // is empty or any of its tiles is already shut.
  void shut(const Move& m);

  int score() const;
  bool is_fully_shut() const { return open_ == 0; }
  int tiles_closed() const;

  std::uint16_t open_mask() const { return open_; }
  std::vector<int> open_tiles() const;

  // "[1 2 _ 4 5 _ 7 8 9]"
  std::string to_string() const;

  bool operator==(const Board& o) const { return open_ == o.open_; }
  bool operator!=(const Board& o) const { return open_ != o.open_; }

private:
  std::uint16_t open_ = kAllTilesMask;
};

} // namespace shutbox
