#pragma once
#include <cstdint>
#include <stdexcept>

namespace shutbox {

constexpr int kMinTile = 1;
constexpr int kMaxTile = 9;
constexpr int kNumTiles = kMaxTile - kMinTile + 1;
constexpr std::uint16_t kAllTilesMask = (1u << kNumTiles) - 1;

constexpr int kDieFaces = 6;
constexpr int kMinTarget = 2;
constexpr int kMaxTarget = 2 * kDieFaces;

// Tile t lives at bit (t - 1).
constexpr std::uint16_t tile_bit(int tile) {
  return static_cast<std::uint16_t>(1u << (tile - kMinTile));
}

constexpr bool is_valid_tile(int tile) {
  return tile >= kMinTile && tile <= kMaxTile;
}

// Broken move generation or application. Never recovered inside a game.
class InvariantViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace shutbox
