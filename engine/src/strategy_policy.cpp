#include "shutbox_ai/strategy_policy.hpp"
#include <stdexcept>
#include <utility>

namespace shutbox_ai {

StrategyId parse_strategy_id(int value) {
  if (value < 0 || value >= kNumStrategies) {
    throw std::invalid_argument("Unknown strategy id: " + std::to_string(value) +
                                " (expected 0.." + std::to_string(kNumStrategies - 1) + ")");
  }
  return static_cast<StrategyId>(value);
}

std::string strategy_name(StrategyId id) {
  switch (id) {
    case StrategyId::Random:       return "Random";
    case StrategyId::SingleSeeker: return "SingleSeeker";
    case StrategyId::BigBlocker:   return "BigBlocker";
    case StrategyId::SmartGuesser: return "SmartGuesser";
    case StrategyId::InsideOut:    return "InsideOut";
    case StrategyId::OutsideIn:    return "OutsideIn";
  }
  return "Unknown";
}

std::string strategy_description(StrategyId id) {
  switch (id) {
    case StrategyId::Random:       return "Random Choice";
    case StrategyId::SingleSeeker: return "Single Tile Priority";
    case StrategyId::BigBlocker:   return "Maximum Immediate Reward";
    case StrategyId::SmartGuesser: return "Maximum Remaining Coverage";
    case StrategyId::InsideOut:    return "Inside Out";
    case StrategyId::OutsideIn:    return "Outside In";
  }
  return "Unknown Strategy";
}

StrategyPolicy::StrategyPolicy(StrategyId id, Impl impl) : id_(id), impl_(std::move(impl)) {}

StrategyPolicy StrategyPolicy::create(StrategyId id, std::uint64_t seed) {
  switch (id) {
    case StrategyId::Random:       return StrategyPolicy(id, RandomPolicy(seed));
    case StrategyId::SingleSeeker: return StrategyPolicy(id, SingleSeekerPolicy{});
    case StrategyId::BigBlocker:   return StrategyPolicy(id, BigBlockerPolicy{});
    case StrategyId::SmartGuesser: return StrategyPolicy(id, SmartGuesserPolicy{});
    case StrategyId::InsideOut:    return StrategyPolicy(id, InsideOutPolicy{});
    case StrategyId::OutsideIn:    return StrategyPolicy(id, OutsideInPolicy{});
  }
  throw std::invalid_argument("StrategyPolicy::create: unknown strategy id " +
                              std::to_string(to_int(id)));
}

shutbox::Move StrategyPolicy::choose(const shutbox::Board& b, const shutbox::Roll& r,
                                     const shutbox::MoveList& moves) {
  return std::visit([&](auto& policy) { return policy.choose(b, r, moves); }, impl_);
}

} // namespace shutbox_ai
