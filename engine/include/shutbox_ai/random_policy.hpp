#pragma once
#include "shutbox/board.hpp"
#include "shutbox/dice.hpp"
#include "shutbox/move.hpp"
#include "shutbox/move_list.hpp"
#include <cstdint>
#include <random>

namespace shutbox_ai {

// Uniform choice over the legal moves. Reproducible for a fixed seed.
class RandomPolicy {
public:
  explicit RandomPolicy(std::uint64_t seed);

  shutbox::Move choose(const shutbox::Board& b, const shutbox::Roll& r,
                       const shutbox::MoveList& moves);

private:
  std::mt19937_64 rng_;
};

} // namespace shutbox_ai
