#include "shutbox_sim/simulation_harness.hpp"
#include "shutbox/dice.hpp"
#include "shutbox_ai/strategy_policy.hpp"
#include "shutbox_sim/errors.hpp"
#include "shutbox_sim/game_runner.hpp"
#include "shutbox_sim/result_writer.hpp"
#include "shutbox_sim/seeding.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <queue>
#include <random>
#include <thread>
#include <utility>

namespace shutbox_sim {

using shutbox_ai::StrategyId;

namespace {

// A finished game tagged with where it belongs.
struct FinishedGame {
  size_t strategy_slot = 0;
  int game_index = 0;
  GameOutcome outcome;
};

/**
 * Thread-safe hand-off from the workers to the collector.
 */
class OutcomeQueue {
private:
  std::queue<FinishedGame> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool done_ = false;

public:
  void push(FinishedGame&& game) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(game));
    cv_.notify_one();
  }

  bool pop(FinishedGame& game) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || done_; });

    if (queue_.empty()) {
      return false;  // done and drained
    }

    game = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void set_done() {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
    cv_.notify_all();
  }
};

// First game failure of the batch.
struct Failure {
  std::mutex mutex;
  bool failed = false;
  StrategyId strategy = StrategyId::Random;
  int game_index = 0;
  std::uint64_t game_seed = 0;
  std::string message;
};

/**
 * Worker: claims jobs until the batch is exhausted or stopped.
 * Job j is game (j % num_games) of strategy slot (j / num_games).
 */
void worker_thread(
    int worker_id,
    const SimulationConfig& config,
    const std::vector<StrategyId>& strategies,
    const SimulationHarness::GameFunction& play,
    OutcomeQueue& queue,
    std::atomic<long long>& next_job,
    const std::atomic<bool>& stop,
    std::atomic<bool>& abort,
    Failure& failure
) {
  const long long total_jobs = static_cast<long long>(strategies.size()) * config.num_games;

  if (config.verbose) {
    std::cout << "[Worker " << worker_id << "] Started\n";
  }

  int worker_games = 0;
  auto worker_start = std::chrono::steady_clock::now();

  while (!stop.load() && !abort.load()) {
    const long long job = next_job.fetch_add(1);
    if (job >= total_jobs) {
      break;
    }

    const size_t slot = static_cast<size_t>(job / config.num_games);
    const int game_index = static_cast<int>(job % config.num_games);
    const StrategyId strategy = strategies[slot];
    const std::uint64_t game_seed = derive_game_seed(config.seed, strategy, game_index);

    try {
      GameOutcome outcome = play(strategy, game_seed, config.record_traces);
      queue.push(FinishedGame{slot, game_index, std::move(outcome)});
      worker_games++;
    } catch (const std::exception& e) {
      {
        std::lock_guard<std::mutex> lock(failure.mutex);
        if (!failure.failed) {
          failure.failed = true;
          failure.strategy = strategy;
          failure.game_index = game_index;
          failure.game_seed = game_seed;
          failure.message = e.what();
        }
      }
      abort.store(true);
      std::cerr << "[Worker " << worker_id << "] Game " << game_index << " of "
                << shutbox_ai::strategy_name(strategy) << " failed: " << e.what() << "\n";
      break;
    }
  }

  if (config.verbose) {
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - worker_start).count();
    std::cout << "[Worker " << worker_id << "] Finished - Played " << worker_games
              << " games in " << total_time << "ms\n";
  }
}

/**
 * Collector: files finished games into the records in game-index order.
 * Games that arrive early wait in a per-strategy buffer until the gap before
 * them is filled.
 */
void collector_thread(
    const SimulationConfig& config,
    OutcomeQueue& queue,
    BatchResult& result
) {
  const size_t num_slots = result.records.size();
  std::vector<int> next_index(num_slots, 0);
  std::vector<std::map<int, GameOutcome>> pending(num_slots);
  std::vector<long long> score_sum(num_slots, 0);
  std::vector<long long> closed_sum(num_slots, 0);

  long long collected = 0;
  auto start_time = std::chrono::steady_clock::now();

  FinishedGame item;
  while (queue.pop(item)) {
    const size_t slot = item.strategy_slot;
    pending[slot].emplace(item.game_index, std::move(item.outcome));

    auto it = pending[slot].find(next_index[slot]);
    while (it != pending[slot].end()) {
      SimulationRecord& record = result.records[slot];
      score_sum[slot] += it->second.score;
      closed_sum[slot] += it->second.tiles_closed;
      record.games.push_back(std::move(it->second));
      pending[slot].erase(it);
      next_index[slot]++;
      collected++;

      const int done = record.num_games();
      if (config.verbose && config.progress_interval > 0 &&
          (done % config.progress_interval == 0 || done == config.num_games)) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        float games_per_sec = collected * 1000.0f / static_cast<float>(elapsed + 1);
        std::cout << "[Collector] " << std::left << std::setw(12)
                  << shutbox_ai::strategy_name(record.strategy) << std::right
                  << " Games " << std::setw(7) << done << "/" << config.num_games
                  << " | Avg score: " << std::fixed << std::setprecision(2)
                  << static_cast<double>(score_sum[slot]) / done
                  << " | Avg closed: " << std::setprecision(1)
                  << static_cast<double>(closed_sum[slot]) / done
                  << " | " << std::setprecision(1) << games_per_sec << " g/s\n";
      }

      it = pending[slot].find(next_index[slot]);
    }
  }
}

SimulationConfig validated(SimulationConfig config) {
  config.validate();
  return config;
}

} // namespace

SimulationHarness::SimulationHarness(SimulationConfig config)
  : SimulationHarness(std::move(config), &SimulationHarness::play_game) {}

SimulationHarness::SimulationHarness(SimulationConfig config, GameFunction play)
  : config_(validated(std::move(config))), strategies_(config_.strategy_ids()),
    play_(std::move(play)) {
  if (!play_) {
    throw ConfigError("Invalid simulation config: no game function");
  }
}

GameOutcome SimulationHarness::play_game(StrategyId strategy, std::uint64_t game_seed,
                                         bool record_trace) {
  std::mt19937_64 dice_rng(game_seed);
  shutbox::DiceRoller dice(dice_rng);
  shutbox_ai::StrategyPolicy policy =
      shutbox_ai::StrategyPolicy::create(strategy, derive_policy_seed(game_seed));

  GameRunner runner(dice, record_trace);
  return runner.play_to_end(policy);
}

const BatchResult& SimulationHarness::simulate() {
  result_ = BatchResult{};
  result_.seed = config_.seed;
  result_.traces = config_.record_traces;
  for (StrategyId id : strategies_) {
    SimulationRecord record;
    record.strategy = id;
    record.seed = config_.seed;
    result_.records.push_back(std::move(record));
  }

  if (config_.verbose) {
    std::cout << "[Harness] Batch: " << strategies_.size() << " strategies x "
              << config_.num_games << " games | seed " << config_.seed << " | "
              << config_.num_threads << " threads"
              << (config_.record_traces ? " | traces on" : "") << "\n";
    for (StrategyId id : strategies_) {
      std::cout << "[Harness]   " << shutbox_ai::to_int(id) << ": "
                << shutbox_ai::strategy_name(id) << " ("
                << shutbox_ai::strategy_description(id) << ")\n";
    }
  }

  OutcomeQueue queue;
  std::atomic<long long> next_job(0);
  std::atomic<bool> abort(false);
  Failure failure;

  auto start_time = std::chrono::steady_clock::now();

  std::thread collector(collector_thread, std::cref(config_), std::ref(queue), std::ref(result_));

  std::vector<std::thread> workers;
  try {
    workers.reserve(static_cast<size_t>(config_.num_threads));
    for (int i = 0; i < config_.num_threads; ++i) {
      workers.emplace_back(worker_thread, i, std::cref(config_), std::cref(strategies_),
                           std::cref(play_), std::ref(queue), std::ref(next_job),
                           std::cref(stop_), std::ref(abort), std::ref(failure));
    }
  } catch (...) {
    // Thread creation failed: wind down what is already running, then report
    abort.store(true);
    for (auto& worker : workers) {
      worker.join();
    }
    queue.set_done();
    collector.join();
    throw;
  }

  for (auto& worker : workers) {
    worker.join();
  }
  queue.set_done();
  collector.join();

  // Strategies that never started leave no record
  result_.records.erase(
      std::remove_if(result_.records.begin(), result_.records.end(),
                     [](const SimulationRecord& r) { return r.games.empty(); }),
      result_.records.end());

  if (failure.failed) {
    throw SimulationError(failure.strategy, failure.game_index, failure.game_seed, failure.message);
  }

  if (config_.verbose) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    long long total = 0;
    for (const auto& r : result_.records) total += r.num_games();
    if (stop_requested()) {
      std::cout << "[Harness] Stop requested - keeping " << total << " finished games\n";
    }
    std::cout << "[Harness] Finished " << total << " games in " << elapsed << "ms\n";
  }

  return result_;
}

const BatchResult& SimulationHarness::run() {
  simulate();
  persist();
  return result_;
}

void SimulationHarness::persist() const {
  persist(config_.output_path, config_.csv_path);
}

void SimulationHarness::persist(const std::string& json_path, const std::string& csv_path) const {
  ResultWriter::write_json(result_, json_path);
  if (config_.verbose) {
    std::cout << "[Harness] Results saved to " << json_path << "\n";
  }
  if (!csv_path.empty()) {
    ResultWriter::write_csv(result_, csv_path);
    if (config_.verbose) {
      std::cout << "[Harness] CSV saved to " << csv_path << "\n";
    }
  }
}

} // namespace shutbox_sim
