#include "shutbox_ai/random_policy.hpp"

namespace shutbox_ai {

RandomPolicy::RandomPolicy(std::uint64_t seed) : rng_(seed) {}

shutbox::Move RandomPolicy::choose(const shutbox::Board& /*b*/, const shutbox::Roll& /*r*/,
                                   const shutbox::MoveList& moves) {
  if (moves.empty()) {
    throw shutbox::InvariantViolation("RandomPolicy::choose called without legal moves");
  }
  std::uniform_int_distribution<std::size_t> pick(0, moves.size - 1);
  return moves[pick(rng_)];
}

} // namespace shutbox_ai
