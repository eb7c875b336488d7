#include <gtest/gtest.h>
#include "shutbox_sim/game_runner.hpp"
#include "shutbox_sim/replay.hpp"
#include "shutbox_ai/heuristic_policies.hpp"
#include "shutbox_ai/strategy_policy.hpp"
#include <random>

using namespace shutbox;
using namespace shutbox_sim;
using shutbox_ai::StrategyId;
using shutbox_ai::StrategyPolicy;

namespace {

// Always returns the same move, legal or not.
struct FixedPolicy {
  Move move;
  Move choose(const Board&, const Roll&, const MoveList&) { return move; }
};

// Counts calls and takes the first listed move.
struct CountingPolicy {
  int calls = 0;
  Move choose(const Board&, const Roll&, const MoveList& moves) {
    ++calls;
    return moves[0];
  }
};

}  // namespace

TEST(GameRunnerTest, NoLegalMoveEndsGame) {
  std::mt19937_64 rng(1);
  DiceRoller dice(rng);
  GameRunner runner(dice, Board::from_open_tiles({9}), true);
  CountingPolicy policy;

  EXPECT_EQ(runner.play_round(Roll(3, 4), policy), GameRunner::Status::Complete);
  EXPECT_EQ(policy.calls, 0);

  GameOutcome out = runner.outcome();
  EXPECT_EQ(out.score, 9);
  EXPECT_EQ(out.rounds, 0);
  EXPECT_EQ(out.tiles_closed, 8);
  ASSERT_TRUE(out.final_roll.has_value());
  EXPECT_EQ(*out.final_roll, Roll(3, 4));
}

TEST(GameRunnerTest, ShuttingTheBoxEndsGame) {
  std::mt19937_64 rng(1);
  DiceRoller dice(rng);
  GameRunner runner(dice, Board::from_open_tiles({3, 4}), true);
  shutbox_ai::BigBlockerPolicy policy;

  EXPECT_EQ(runner.play_round(Roll(3, 4), policy), GameRunner::Status::Complete);
  GameOutcome out = runner.outcome();
  EXPECT_EQ(out.score, 0);
  EXPECT_EQ(out.tiles_closed, 9);
  EXPECT_EQ(out.rounds, 1);
  EXPECT_FALSE(out.final_roll.has_value());
  ASSERT_EQ(out.trace.size(), 1u);
  EXPECT_EQ(out.trace[0].board_before, Board::from_open_tiles({3, 4}));
  EXPECT_EQ(out.trace[0].move, Move::from_tiles({3, 4}));
}

TEST(GameRunnerTest, ScriptedRounds) {
  std::mt19937_64 rng(1);
  DiceRoller dice(rng);
  GameRunner runner(dice, true);
  shutbox_ai::SingleSeekerPolicy policy;

  EXPECT_EQ(runner.play_round(Roll(3, 4), policy), GameRunner::Status::InProgress);
  EXPECT_FALSE(runner.board().is_open(7));
  EXPECT_EQ(runner.play_round(Roll(3, 4), policy), GameRunner::Status::InProgress);
  EXPECT_FALSE(runner.board().is_open(3));
  EXPECT_FALSE(runner.board().is_open(4));
  EXPECT_EQ(runner.rounds(), 2);
  EXPECT_THROW(runner.outcome(), InvariantViolation);
}

TEST(GameRunnerTest, RoundAfterCompleteThrows) {
  std::mt19937_64 rng(1);
  DiceRoller dice(rng);
  GameRunner runner(dice, Board::from_open_tiles({9}));
  CountingPolicy policy;
  runner.play_round(Roll(1, 1), policy);
  ASSERT_TRUE(runner.is_complete());
  EXPECT_THROW(runner.play_round(Roll(4, 5), policy), InvariantViolation);
  EXPECT_THROW(runner.play_round(policy), InvariantViolation);
}

TEST(GameRunnerTest, FullyShutStartIsComplete) {
  std::mt19937_64 rng(1);
  DiceRoller dice(rng);
  GameRunner runner(dice, Board::from_open_mask(0));
  EXPECT_TRUE(runner.is_complete());
  EXPECT_EQ(runner.outcome().score, 0);
}

TEST(GameRunnerTest, IllegalPolicyChoiceThrows) {
  std::mt19937_64 rng(1);
  DiceRoller dice(rng);
  GameRunner runner(dice);
  FixedPolicy policy{Move::from_tiles({2, 4})};
  const Board before = runner.board();
  EXPECT_THROW(runner.play_round(Roll(3, 4), policy), InvariantViolation);
  EXPECT_EQ(runner.board(), before);
}

TEST(GameRunnerTest, TerminalStateHoldsForEveryStrategy) {
  for (StrategyId id : shutbox_ai::kAllStrategies) {
    for (int g = 0; g < 200; ++g) {
      std::mt19937_64 rng(1000 + g);
      DiceRoller dice(rng);
      StrategyPolicy policy = StrategyPolicy::create(id, 500 + g);
      GameRunner runner(dice, true);
      GameOutcome out = runner.play_to_end(policy);

      EXPECT_EQ(out.score, out.final_board.score());
      EXPECT_EQ(out.tiles_closed + static_cast<int>(out.final_board.open_tiles().size()), 9);
      EXPECT_EQ(out.rounds, static_cast<int>(out.trace.size()));
      if (out.score != 0) {
        ASSERT_TRUE(out.final_roll.has_value());
        MoveList moves;
        Rules::legal_moves(out.final_board, *out.final_roll, moves);
        EXPECT_TRUE(moves.empty());
      } else {
        EXPECT_FALSE(out.final_roll.has_value());
      }

      std::string error;
      EXPECT_TRUE(verify_trace(out, &error)) << shutbox_ai::strategy_name(id) << ": " << error;
    }
  }
}

TEST(GameRunnerTest, TraceOffStillKeepsRollsAndMoves) {
  std::mt19937_64 rng(3);
  DiceRoller dice(rng);
  StrategyPolicy policy = StrategyPolicy::create(StrategyId::BigBlocker, 0);
  GameRunner runner(dice);
  GameOutcome out = runner.play_to_end(policy);
  EXPECT_TRUE(out.trace.empty());
  EXPECT_FALSE(out.final_roll.has_value());
  EXPECT_GE(out.rounds, 1);

  // Applied rolls and moves are kept even without a trace
  ASSERT_EQ(out.rolls.size(), static_cast<size_t>(out.rounds));
  ASSERT_EQ(out.moves.size(), static_cast<size_t>(out.rounds));
  Board replay;
  for (int i = 0; i < out.rounds; ++i) {
    EXPECT_TRUE(Rules::is_legal(replay, out.rolls[i], out.moves[i])) << "round " << i;
    replay.shut(out.moves[i]);
  }
  EXPECT_EQ(replay, out.final_board);
}

TEST(ReplayTest, DetectsTamperedTrace) {
  std::mt19937_64 rng(11);
  DiceRoller dice(rng);
  StrategyPolicy policy = StrategyPolicy::create(StrategyId::SmartGuesser, 0);
  GameRunner runner(dice, true);
  GameOutcome out = runner.play_to_end(policy);
  ASSERT_TRUE(verify_trace(out));

  GameOutcome bad_score = out;
  bad_score.score += 1;
  EXPECT_FALSE(verify_trace(bad_score));

  GameOutcome bad_move = out;
  bad_move.trace[0].move = Move::from_tiles({9});
  bad_move.trace[0].roll = Roll(1, 1);
  std::string error;
  EXPECT_FALSE(verify_trace(bad_move, &error));
  EXPECT_NE(error.find("round 1"), std::string::npos);
}
