#pragma once
#include "shutbox/types.hpp"
#include <random>

namespace shutbox {

// The two dice of one round.
struct Roll {
  int d1 = 1;
  int d2 = 1;

  Roll() = default;
  // Throws InvariantViolation if either die is outside [1,6].
  Roll(int die1, int die2);

  int target() const { return d1 + d2; }

  bool operator==(const Roll& o) const { return d1 == o.d1 && d2 == o.d2; }
  bool operator!=(const Roll& o) const { return !(*this == o); }
};

/**
 * Two-dice roller over a caller-owned engine.
 *
 * The roller never seeds anything itself: reproducing a game means
 * reproducing the engine state it was handed.
 */
class DiceRoller {
public:
  explicit DiceRoller(std::mt19937_64& rng);

  Roll roll();

private:
  std::mt19937_64& rng_;
  std::uniform_int_distribution<int> die_;
};

} // namespace shutbox
