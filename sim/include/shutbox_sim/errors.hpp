#pragma once
#include "shutbox_ai/strategy_id.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace shutbox_sim {

// Rejected SimulationConfig. Raised before any game starts.
class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Result file could not be written. The in-memory result is kept.
class PersistenceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A game failed inside the batch. Carries what is needed to replay it.
class SimulationError : public std::runtime_error {
public:
  SimulationError(shutbox_ai::StrategyId strategy, int game_index, std::uint64_t game_seed,
                  const std::string& what);

  shutbox_ai::StrategyId strategy() const { return strategy_; }
  int game_index() const { return game_index_; }
  std::uint64_t game_seed() const { return game_seed_; }

private:
  shutbox_ai::StrategyId strategy_;
  int game_index_;
  std::uint64_t game_seed_;
};

} // namespace shutbox_sim
