#include "shutbox_sim/simulation_config.hpp"
#include "shutbox_sim/errors.hpp"
#include <set>
#include <sstream>

namespace shutbox_sim {

void SimulationConfig::validate() const {
  std::vector<std::string> problems;

  if (strategies.empty()) {
    problems.push_back("no strategies configured");
  }
  std::set<int> seen;
  for (int id : strategies) {
    if (id < 0 || id >= shutbox_ai::kNumStrategies) {
      problems.push_back("invalid strategy id " + std::to_string(id));
    } else if (!seen.insert(id).second) {
      problems.push_back("strategy id " + std::to_string(id) + " listed twice");
    }
  }
  if (num_games <= 0) {
    problems.push_back("num_games must be positive (got " + std::to_string(num_games) + ")");
  }
  if (num_threads <= 0 || num_threads > kMaxThreads) {
    problems.push_back("num_threads must be in 1.." + std::to_string(kMaxThreads) + " (got " +
                       std::to_string(num_threads) + ")");
  }
  if (output_path.empty()) {
    problems.push_back("output_path is empty");
  }
  if (progress_interval < 0) {
    problems.push_back("progress_interval must not be negative");
  }

  if (!problems.empty()) {
    std::ostringstream oss;
    oss << "Invalid simulation config: ";
    for (size_t i = 0; i < problems.size(); ++i) {
      if (i > 0) oss << "; ";
      oss << problems[i];
    }
    throw ConfigError(oss.str());
  }
}

std::vector<shutbox_ai::StrategyId> SimulationConfig::strategy_ids() const {
  std::vector<shutbox_ai::StrategyId> ids;
  ids.reserve(strategies.size());
  for (int id : strategies) {
    ids.push_back(shutbox_ai::parse_strategy_id(id));
  }
  return ids;
}

} // namespace shutbox_sim
