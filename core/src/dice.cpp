#include "shutbox/dice.hpp"
#include <string>

namespace shutbox {

Roll::Roll(int die1, int die2) : d1(die1), d2(die2) {
  if (die1 < 1 || die1 > kDieFaces || die2 < 1 || die2 > kDieFaces) {
    throw InvariantViolation("Roll die out of range: (" + std::to_string(die1) + "," +
                             std::to_string(die2) + ")");
  }
}

DiceRoller::DiceRoller(std::mt19937_64& rng) : rng_(rng), die_(1, kDieFaces) {}

Roll DiceRoller::roll() {
  const int d1 = die_(rng_);
  const int d2 = die_(rng_);
  return Roll(d1, d2);
}

} // namespace shutbox
