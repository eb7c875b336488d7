#pragma once
#include "shutbox_ai/strategy_id.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace shutbox_sim {

/**
 * Batch run settings. Built once by the caller and copied into the harness,
 * which validates it before anything runs.
 */
struct SimulationConfig {
  static constexpr int kMaxThreads = 1024;

  std::vector<int> strategies = {0, 1, 2, 3, 4, 5};  // strategy ids, run in this order
  int num_games = 1000;                              // games per strategy
  std::uint64_t seed = 0;                            // base seed of every per-game seed
  std::string output_path = "stb_results.json";      // JSON result file
  std::string csv_path;                              // optional CSV export, empty = none
  int num_threads = 4;                               // worker threads
  bool record_traces = false;                        // keep round-by-round traces
  int progress_interval = 0;                         // progress line every N games, 0 = off
  bool verbose = false;                              // console logging

  // Throws ConfigError naming every problem found.
  void validate() const;

  // Validated ids as StrategyId values.
  std::vector<shutbox_ai::StrategyId> strategy_ids() const;
};

} // namespace shutbox_sim
