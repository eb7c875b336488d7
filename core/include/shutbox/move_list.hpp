#pragma once
#include "shutbox/move.hpp"
#include <array>
#include <cstddef>
#include <stdexcept>

namespace shutbox {

// Fixed-capacity storage for one legal move set. No subset-sum target in
// [2,12] has more than 12 distinct subsets of {1..9}.
struct MoveList {
  static constexpr std::size_t kCapacity = 16;

  std::array<Move, kCapacity> moves{};
  std::size_t size = 0;

  void clear() { size = 0; }
  bool empty() const { return size == 0; }

  void push_back(const Move& m) {
    if (size >= kCapacity) {
      throw std::length_error("MoveList capacity exceeded");
    }
    moves[size++] = m;
  }

  bool contains(const Move& m) const {
    for (std::size_t i = 0; i < size; ++i) {
      if (moves[i] == m) return true;
    }
    return false;
  }

  Move& operator[](std::size_t i) { return moves[i]; }
  const Move& operator[](std::size_t i) const { return moves[i]; }

  Move* begin() { return moves.data(); }
  Move* end() { return moves.data() + size; }
  const Move* begin() const { return moves.data(); }
  const Move* end() const { return moves.data() + size; }
};

} // namespace shutbox
