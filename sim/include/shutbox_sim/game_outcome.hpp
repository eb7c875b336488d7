#pragma once
#include "shutbox/board.hpp"
#include "shutbox/dice.hpp"
#include "shutbox/move.hpp"
#include "shutbox_ai/strategy_id.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace shutbox_sim {

// One applied move: the position it was played from, the roll, the choice.
struct RoundTrace {
  shutbox::Board board_before;
  shutbox::Roll roll;
  shutbox::Move move;
};

struct GameOutcome {
  shutbox::Board final_board;
  int rounds = 0;        // moves applied; the roll that ended the game is not counted
  int score = 0;         // sum of open tiles, 0 for a shut box
  int tiles_closed = 0;

  // Roll and chosen move of every applied round, always kept (at most nine).
  std::vector<shutbox::Roll> rolls;
  std::vector<shutbox::Move> moves;

  // Filled only when traces are recorded.
  std::vector<RoundTrace> trace;
  std::optional<shutbox::Roll> final_roll;  // roll with no legal move, unset for a shut box
};

// Outcomes of one strategy in game-index order.
struct SimulationRecord {
  shutbox_ai::StrategyId strategy = shutbox_ai::StrategyId::Random;
  std::uint64_t seed = 0;
  std::vector<GameOutcome> games;

  int num_games() const { return static_cast<int>(games.size()); }
};

struct BatchResult {
  std::uint64_t seed = 0;
  bool traces = false;
  std::vector<SimulationRecord> records;
};

} // namespace shutbox_sim
