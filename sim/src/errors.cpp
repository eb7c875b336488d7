#include "shutbox_sim/errors.hpp"

namespace shutbox_sim {

SimulationError::SimulationError(shutbox_ai::StrategyId strategy, int game_index,
                                 std::uint64_t game_seed, const std::string& what)
  : std::runtime_error("strategy " + std::to_string(shutbox_ai::to_int(strategy)) + " (" +
                       shutbox_ai::strategy_name(strategy) + "), game " +
                       std::to_string(game_index) + ", game seed " + std::to_string(game_seed) +
                       ": " + what),
    strategy_(strategy), game_index_(game_index), game_seed_(game_seed) {}

} // namespace shutbox_sim
