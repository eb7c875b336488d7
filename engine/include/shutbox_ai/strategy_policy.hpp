#pragma once
#include "shutbox_ai/strategy_id.hpp"
#include "shutbox_ai/random_policy.hpp"
#include "shutbox_ai/heuristic_policies.hpp"
#include <cstdint>
#include <variant>

namespace shutbox_ai {

/**
 * One of the six strategies behind a single choose() entry point.
 *
 * The concrete policy is fixed when the object is created; choose() only
 * forwards to it. The seed feeds the Random strategy and is ignored by the
 * deterministic ones.
 *
 * Usage:
 *   StrategyPolicy policy = StrategyPolicy::create(StrategyId::BigBlocker, seed);
 *   shutbox::Move m = policy.choose(board, roll, moves);
 */
class StrategyPolicy {
public:
  static StrategyPolicy create(StrategyId id, std::uint64_t seed);

  // moves must be non-empty (InvariantViolation otherwise).
  shutbox::Move choose(const shutbox::Board& b, const shutbox::Roll& r,
                       const shutbox::MoveList& moves);

  StrategyId id() const { return id_; }

private:
  using Impl = std::variant<RandomPolicy, SingleSeekerPolicy, BigBlockerPolicy,
                            SmartGuesserPolicy, InsideOutPolicy, OutsideInPolicy>;

  StrategyPolicy(StrategyId id, Impl impl);

  StrategyId id_;
  Impl impl_;
};

} // namespace shutbox_ai
