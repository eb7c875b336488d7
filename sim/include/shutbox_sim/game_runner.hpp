#pragma once
#include "shutbox/board.hpp"
#include "shutbox/dice.hpp"
#include "shutbox/move_list.hpp"
#include "shutbox/rules.hpp"
#include "shutbox_sim/game_outcome.hpp"
#include <vector>

namespace shutbox_sim {

/**
 * Drives one game from a fresh board to its terminal state.
 *
 * Each round rolls (or takes a scripted roll), enumerates the legal moves,
 * ends the game if there are none, and otherwise applies the move the policy
 * picks. The game also ends when the box is shut. Any round requested after
 * that throws InvariantViolation.
 *
 * Policy is any type with
 *   shutbox::Move choose(const Board&, const Roll&, const MoveList&)
 * e.g. shutbox_ai::StrategyPolicy or the console adapter.
 */
class GameRunner {
public:
  enum class Status { InProgress, Complete };

  explicit GameRunner(shutbox::DiceRoller& dice, bool record_trace = false);
  GameRunner(shutbox::DiceRoller& dice, const shutbox::Board& start, bool record_trace = false);

  template <typename Policy>
  Status play_round(Policy& policy) {
    ensure_in_progress();
    return play_round(dice_.roll(), policy);
  }

  template <typename Policy>
  Status play_round(const shutbox::Roll& roll, Policy& policy) {
    ensure_in_progress();
    shutbox::MoveList moves;
    if (!begin_round(roll, moves)) {
      return status_;
    }
    const shutbox::Move chosen = policy.choose(board_, roll, moves);
    return finish_round(roll, moves, chosen);
  }

  template <typename Policy>
  GameOutcome play_to_end(Policy& policy) {
    while (status_ == Status::InProgress) {
      play_round(policy);
    }
    return outcome();
  }

  Status status() const { return status_; }
  bool is_complete() const { return status_ == Status::Complete; }
  const shutbox::Board& board() const { return board_; }
  int rounds() const { return rounds_; }

  // Terminal snapshot. Throws InvariantViolation while the game is running.
  GameOutcome outcome() const;

private:
  void ensure_in_progress() const;
  // Fills moves; completes the game and returns false when there are none.
  bool begin_round(const shutbox::Roll& roll, shutbox::MoveList& moves);
  Status finish_round(const shutbox::Roll& roll, const shutbox::MoveList& moves,
                      const shutbox::Move& chosen);

  shutbox::DiceRoller& dice_;
  shutbox::Board board_;
  Status status_ = Status::InProgress;
  int rounds_ = 0;
  bool record_trace_;
  std::vector<shutbox::Roll> rolls_;
  std::vector<shutbox::Move> moves_;
  std::vector<RoundTrace> trace_;
  std::optional<shutbox::Roll> final_roll_;
};

} // namespace shutbox_sim
