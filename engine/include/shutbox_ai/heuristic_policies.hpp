#pragma once
#include "shutbox/board.hpp"
#include "shutbox/dice.hpp"
#include "shutbox/move.hpp"
#include "shutbox/move_list.hpp"

namespace shutbox_ai {

/*
Deterministic policies. Each one ranks the legal moves by a total order, so
the chosen move depends only on (board, roll, moves) and never on the order
the moves were listed in.

SingleSeekerPolicy  → one tile equal to the roll total, else exactly the two
                      dice faces, else the lexicographically smallest move
BigBlockerPolicy    → most tiles; ties to the smallest tile sequence
SmartGuesserPolicy  → keep the most roll totals (2..12) still closable
InsideOutPolicy     → tiles nearest 5 first (sum of |t - 5|)
OutsideInPolicy     → tiles nearest 1 or 9 first (sum of min(t - 1, 9 - t))

InsideOut and OutsideIn break ties by fewer tiles, then tile sequence.
*/

class SingleSeekerPolicy {
public:
  shutbox::Move choose(const shutbox::Board& b, const shutbox::Roll& r,
                       const shutbox::MoveList& moves) const;
};

class BigBlockerPolicy {
public:
  shutbox::Move choose(const shutbox::Board& b, const shutbox::Roll& r,
                       const shutbox::MoveList& moves) const;
};

class SmartGuesserPolicy {
public:
  shutbox::Move choose(const shutbox::Board& b, const shutbox::Roll& r,
                       const shutbox::MoveList& moves) const;

  // Roll totals still closable after m is applied to b.
  static int remaining_coverage(const shutbox::Board& b, const shutbox::Move& m);
};

class InsideOutPolicy {
public:
  shutbox::Move choose(const shutbox::Board& b, const shutbox::Roll& r,
                       const shutbox::MoveList& moves) const;

  static int center_distance(const shutbox::Move& m);
};

class OutsideInPolicy {
public:
  shutbox::Move choose(const shutbox::Board& b, const shutbox::Roll& r,
                       const shutbox::MoveList& moves) const;

  static int edge_distance(const shutbox::Move& m);
};

} // namespace shutbox_ai
