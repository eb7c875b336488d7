#pragma once
#include "shutbox_ai/strategy_id.hpp"
#include "shutbox_sim/game_outcome.hpp"
#include "shutbox_sim/simulation_config.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace shutbox_sim {

/**
 * Batch simulator.
 *
 * Runs config.num_games independent games for every configured strategy on a
 * pool of worker threads and keeps the outcomes in game order per strategy.
 * Game i of strategy s is seeded with derive_game_seed(config.seed, s, i), so
 * every game and the batch as a whole replay exactly from the base seed.
 *
 * Threading:
 *   - Workers claim job indices from an atomic counter and play whole games.
 *   - Finished games go through a locked queue to a collector thread, which
 *     reorders them by game index into the per-strategy records.
 *   - request_stop() makes workers stop claiming; games already claimed still
 *     finish, so each strategy keeps a gap-free prefix of its games.
 *
 * Usage:
 *   SimulationHarness harness(config);   // throws ConfigError
 *   const BatchResult& r = harness.run(); // simulate + persist
 */
class SimulationHarness {
public:
  // Plays one game: (strategy, game seed, record trace) -> outcome.
  using GameFunction = std::function<GameOutcome(shutbox_ai::StrategyId, std::uint64_t, bool)>;

  explicit SimulationHarness(SimulationConfig config);
  // Same batch with a replacement for play_game (tests inject failures here).
  SimulationHarness(SimulationConfig config, GameFunction play);

  SimulationHarness(const SimulationHarness&) = delete;
  SimulationHarness& operator=(const SimulationHarness&) = delete;

  // Plays the batch and keeps the result in memory. Throws SimulationError if
  // a game fails; games collected before the failure are kept.
  const BatchResult& simulate();

  // simulate() followed by persist().
  const BatchResult& run();

  // Writes the retained result to the configured paths, or to the given ones.
  // Throws PersistenceError; the retained result is unaffected and the call
  // may be repeated.
  void persist() const;
  void persist(const std::string& json_path, const std::string& csv_path = "") const;

  // Safe to call from another thread or a signal handler.
  void request_stop() { stop_.store(true); }
  bool stop_requested() const { return stop_.load(); }

  const BatchResult& results() const { return result_; }
  const SimulationConfig& config() const { return config_; }

  // One complete game, exactly as the batch plays it.
  static GameOutcome play_game(shutbox_ai::StrategyId strategy, std::uint64_t game_seed,
                               bool record_trace);

private:
  const SimulationConfig config_;
  const std::vector<shutbox_ai::StrategyId> strategies_;
  const GameFunction play_;
  std::atomic<bool> stop_{false};
  BatchResult result_;
};

} // namespace shutbox_sim
