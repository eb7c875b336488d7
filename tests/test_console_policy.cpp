#include <gtest/gtest.h>
#include "console_policy.hpp"
#include "shutbox/rules.hpp"
#include "shutbox_sim/game_runner.hpp"
#include <random>
#include <sstream>

using namespace shutbox;
using shutbox_console::ConsolePolicy;

namespace {

MoveList seven_on_full_board() {
  MoveList moves;
  Rules::legal_moves(Board(), 7, moves);
  return moves;
}

}  // namespace

TEST(ConsolePolicyTest, ParseIndex) {
  MoveList moves = seven_on_full_board();
  EXPECT_EQ(*ConsolePolicy::parse_choice("1", moves), Move::from_tiles({7}));
  EXPECT_EQ(*ConsolePolicy::parse_choice(" 5 ", moves), Move::from_tiles({1, 2, 4}));
  EXPECT_FALSE(ConsolePolicy::parse_choice("0", moves).has_value());
  EXPECT_FALSE(ConsolePolicy::parse_choice("6", moves).has_value());
}

TEST(ConsolePolicyTest, ParseTiles) {
  MoveList moves = seven_on_full_board();
  EXPECT_EQ(*ConsolePolicy::parse_choice("3 4", moves), Move::from_tiles({3, 4}));
  EXPECT_EQ(*ConsolePolicy::parse_choice("4,2,1", moves), Move::from_tiles({1, 2, 4}));
  EXPECT_EQ(*ConsolePolicy::parse_choice("t 7", moves), Move::from_tiles({7}));
  EXPECT_FALSE(ConsolePolicy::parse_choice("t 6", moves).has_value());
  EXPECT_FALSE(ConsolePolicy::parse_choice("2 2 3", moves).has_value());
  EXPECT_FALSE(ConsolePolicy::parse_choice("1 12", moves).has_value());
}

TEST(ConsolePolicyTest, ParseRejectsJunk) {
  MoveList moves = seven_on_full_board();
  EXPECT_FALSE(ConsolePolicy::parse_choice("", moves).has_value());
  EXPECT_FALSE(ConsolePolicy::parse_choice("   ", moves).has_value());
  EXPECT_FALSE(ConsolePolicy::parse_choice("seven", moves).has_value());
  EXPECT_FALSE(ConsolePolicy::parse_choice("3x", moves).has_value());
}

TEST(ConsolePolicyTest, RepromptsUntilLegal) {
  std::istringstream in("hello\n9\nt 2 5\n");
  std::ostringstream out;
  ConsolePolicy policy(in, out);
  MoveList moves = seven_on_full_board();

  EXPECT_EQ(policy.choose(Board(), Roll(3, 4), moves), Move::from_tiles({2, 5}));
  const std::string text = out.str();
  EXPECT_NE(text.find("Roll:  3 + 4 = 7"), std::string::npos) << text;
  EXPECT_NE(text.find("5) {1,2,4}"), std::string::npos) << text;
  EXPECT_NE(text.find("Not a legal move: 'hello'"), std::string::npos) << text;
  EXPECT_NE(text.find("Not a legal move: '9'"), std::string::npos) << text;
}

TEST(ConsolePolicyTest, EndOfInputThrows) {
  std::istringstream in("bad\n");
  std::ostringstream out;
  ConsolePolicy policy(in, out);
  EXPECT_THROW(policy.choose(Board(), Roll(3, 4), seven_on_full_board()), std::runtime_error);
}

TEST(ConsolePolicyTest, DrivesGameRunner) {
  std::mt19937_64 rng(5);
  DiceRoller dice(rng);
  // Always take the first listed move; a game has at most nine rounds
  std::string lines;
  for (int i = 0; i < 9; ++i) lines += "1\n";
  std::istringstream in(lines);
  std::ostringstream out;
  ConsolePolicy policy(in, out);
  shutbox_sim::GameRunner runner(dice, true);
  shutbox_sim::GameOutcome outcome = runner.play_to_end(policy);
  EXPECT_EQ(outcome.rounds, static_cast<int>(outcome.trace.size()));
  EXPECT_LE(outcome.rounds, 9);
}
