#pragma once
#include <array>
#include <string>

namespace shutbox_ai {

enum class StrategyId : int {
  Random = 0,
  SingleSeeker = 1,
  BigBlocker = 2,
  SmartGuesser = 3,
  InsideOut = 4,
  OutsideIn = 5,
};

constexpr int kNumStrategies = 6;

constexpr std::array<StrategyId, kNumStrategies> kAllStrategies = {
  StrategyId::Random,       StrategyId::SingleSeeker, StrategyId::BigBlocker,
  StrategyId::SmartGuesser, StrategyId::InsideOut,    StrategyId::OutsideIn,
};

inline int to_int(StrategyId id) { return static_cast<int>(id); }

// Throws std::invalid_argument unless 0 <= value < kNumStrategies.
StrategyId parse_strategy_id(int value);

// Short identifier used in logs and result files ("SmartGuesser").
std::string strategy_name(StrategyId id);

// Longer human-readable label ("Maximum Remaining Coverage").
std::string strategy_description(StrategyId id);

} // namespace shutbox_ai
