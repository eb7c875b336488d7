#include <gtest/gtest.h>
#include "shutbox_ai/heuristic_policies.hpp"
#include "shutbox_ai/random_policy.hpp"
#include "shutbox_ai/strategy_policy.hpp"
#include "shutbox/rules.hpp"
#include <algorithm>
#include <set>

using namespace shutbox;
using namespace shutbox_ai;

namespace {

MoveList legal(const Board& b, const Roll& r) {
  MoveList moves;
  Rules::legal_moves(b, r, moves);
  return moves;
}

MoveList reversed(const MoveList& moves) {
  MoveList out;
  for (size_t i = moves.size; i > 0; --i) out.push_back(moves[i - 1]);
  return out;
}

}  // namespace

TEST(PolicyTest, SingleSeekerPrefersSingleTile) {
  Board b;
  Roll r(3, 4);
  EXPECT_EQ(SingleSeekerPolicy().choose(b, r, legal(b, r)), Move::from_tiles({7}));
}

TEST(PolicyTest, SingleSeekerFallsBackToDiceFaces) {
  Board b;
  Roll r(4, 6);
  EXPECT_EQ(SingleSeekerPolicy().choose(b, r, legal(b, r)), Move::from_tiles({4, 6}));

  b.shut(Move::from_tiles({7}));
  Roll r2(3, 4);
  EXPECT_EQ(SingleSeekerPolicy().choose(b, r2, legal(b, r2)), Move::from_tiles({3, 4}));
}

TEST(PolicyTest, SingleSeekerDoubleTakesSmallestSequence) {
  Board b;
  Roll r(6, 6);
  EXPECT_EQ(SingleSeekerPolicy().choose(b, r, legal(b, r)), Move::from_tiles({1, 2, 3, 6}));
}

TEST(PolicyTest, BigBlockerTakesMostTiles) {
  Board b;
  Roll r7(3, 4);
  EXPECT_EQ(BigBlockerPolicy().choose(b, r7, legal(b, r7)), Move::from_tiles({1, 2, 4}));
  Roll r10(4, 6);
  EXPECT_EQ(BigBlockerPolicy().choose(b, r10, legal(b, r10)), Move::from_tiles({1, 2, 3, 4}));
}

TEST(PolicyTest, SmartGuesserKeepsMostTotals) {
  Board b;
  Roll r(3, 4);
  MoveList moves = legal(b, r);
  // {7} and {1,6} both leave all eleven totals reachable
  EXPECT_EQ(SmartGuesserPolicy::remaining_coverage(b, Move::from_tiles({7})), 11);
  EXPECT_EQ(SmartGuesserPolicy::remaining_coverage(b, Move::from_tiles({1, 6})), 11);
  EXPECT_EQ(SmartGuesserPolicy::remaining_coverage(b, Move::from_tiles({2, 5})), 10);
  EXPECT_EQ(SmartGuesserPolicy().choose(b, r, moves), Move::from_tiles({1, 6}));

  const Move chosen = SmartGuesserPolicy().choose(b, r, moves);
  for (const Move& m : moves) {
    EXPECT_LE(SmartGuesserPolicy::remaining_coverage(b, m),
              SmartGuesserPolicy::remaining_coverage(b, chosen));
  }
}

TEST(PolicyTest, InsideOutPrefersCenter) {
  Board b;
  Roll r7(3, 4);
  EXPECT_EQ(InsideOutPolicy().choose(b, r7, legal(b, r7)), Move::from_tiles({7}));
  Roll r10(4, 6);
  EXPECT_EQ(InsideOutPolicy().choose(b, r10, legal(b, r10)), Move::from_tiles({4, 6}));
  EXPECT_EQ(InsideOutPolicy::center_distance(Move::from_tiles({4, 6})), 2);
}

TEST(PolicyTest, OutsideInPrefersEdges) {
  Board b;
  Roll r7(3, 4);
  EXPECT_EQ(OutsideInPolicy().choose(b, r7, legal(b, r7)), Move::from_tiles({7}));
  Roll r10(4, 6);
  EXPECT_EQ(OutsideInPolicy().choose(b, r10, legal(b, r10)), Move::from_tiles({1, 9}));
  EXPECT_EQ(OutsideInPolicy::edge_distance(Move::from_tiles({1, 9})), 0);
}

TEST(PolicyTest, DeterministicPoliciesIgnoreListOrder) {
  std::mt19937_64 rng(2024);
  std::uniform_int_distribution<int> mask_dist(1, kAllTilesMask);
  std::uniform_int_distribution<int> die(1, 6);
  for (int i = 0; i < 500; ++i) {
    Board b = Board::from_open_mask(static_cast<std::uint16_t>(mask_dist(rng)));
    Roll r(die(rng), die(rng));
    MoveList moves = legal(b, r);
    if (moves.empty()) continue;
    MoveList back = reversed(moves);
    for (StrategyId id : kAllStrategies) {
      if (id == StrategyId::Random) continue;
      StrategyPolicy p = StrategyPolicy::create(id, 0);
      EXPECT_EQ(p.choose(b, r, moves), p.choose(b, r, back)) << strategy_name(id);
    }
  }
}

TEST(PolicyTest, ChosenMoveIsAlwaysLegal) {
  std::mt19937_64 rng(77);
  std::uniform_int_distribution<int> mask_dist(1, kAllTilesMask);
  std::uniform_int_distribution<int> die(1, 6);
  for (StrategyId id : kAllStrategies) {
    StrategyPolicy p = StrategyPolicy::create(id, 5);
    for (int i = 0; i < 300; ++i) {
      Board b = Board::from_open_mask(static_cast<std::uint16_t>(mask_dist(rng)));
      Roll r(die(rng), die(rng));
      MoveList moves = legal(b, r);
      if (moves.empty()) continue;
      EXPECT_TRUE(moves.contains(p.choose(b, r, moves))) << strategy_name(id);
    }
  }
}

TEST(PolicyTest, EmptyMoveListThrows) {
  Board b;
  Roll r(3, 4);
  MoveList empty;
  for (StrategyId id : kAllStrategies) {
    StrategyPolicy p = StrategyPolicy::create(id, 1);
    EXPECT_THROW(p.choose(b, r, empty), InvariantViolation) << strategy_name(id);
  }
}

TEST(PolicyTest, RandomReproducibleForSeed) {
  Board b;
  Roll r(6, 6);
  MoveList moves = legal(b, r);
  RandomPolicy a(42), c(42);
  std::set<std::uint16_t> picked;
  for (int i = 0; i < 200; ++i) {
    Move ma = a.choose(b, r, moves);
    EXPECT_EQ(ma, c.choose(b, r, moves));
    picked.insert(ma.mask);
  }
  // Uniform over twelve moves: every one shows up in 200 draws
  EXPECT_EQ(picked.size(), moves.size);
}

TEST(StrategyIdTest, ParseAndNames) {
  EXPECT_EQ(parse_strategy_id(0), StrategyId::Random);
  EXPECT_EQ(parse_strategy_id(5), StrategyId::OutsideIn);
  EXPECT_THROW(parse_strategy_id(-1), std::invalid_argument);
  EXPECT_THROW(parse_strategy_id(6), std::invalid_argument);
  EXPECT_EQ(strategy_name(StrategyId::SmartGuesser), "SmartGuesser");
  EXPECT_EQ(strategy_description(StrategyId::SingleSeeker), "Single Tile Priority");
  EXPECT_EQ(StrategyPolicy::create(StrategyId::BigBlocker, 0).id(), StrategyId::BigBlocker);
}
