#include "shutbox_sim/game_runner.hpp"

namespace shutbox_sim {

GameRunner::GameRunner(shutbox::DiceRoller& dice, bool record_trace)
  : dice_(dice), record_trace_(record_trace) {}

GameRunner::GameRunner(shutbox::DiceRoller& dice, const shutbox::Board& start, bool record_trace)
  : dice_(dice), board_(start), record_trace_(record_trace) {
  // A shut box has nothing left to play
  if (board_.is_fully_shut()) status_ = Status::Complete;
}

void GameRunner::ensure_in_progress() const {
  if (status_ == Status::Complete) {
    throw shutbox::InvariantViolation("GameRunner: round requested after the game completed");
  }
}

bool GameRunner::begin_round(const shutbox::Roll& roll, shutbox::MoveList& moves) {
  shutbox::Rules::legal_moves(board_, roll, moves);
  if (moves.empty()) {
    status_ = Status::Complete;
    if (record_trace_) final_roll_ = roll;
    return false;
  }
  return true;
}

GameRunner::Status GameRunner::finish_round(const shutbox::Roll& roll, const shutbox::MoveList& moves,
                                            const shutbox::Move& chosen) {
  if (!moves.contains(chosen)) {
    throw shutbox::InvariantViolation("GameRunner: policy chose " + chosen.to_string() +
                                      " which is not legal on " + board_.to_string() +
                                      " for total " + std::to_string(roll.target()));
  }

  rolls_.push_back(roll);
  moves_.push_back(chosen);
  if (record_trace_) {
    trace_.push_back(RoundTrace{board_, roll, chosen});
  }
  board_.shut(chosen);
  ++rounds_;

  if (board_.is_fully_shut()) {
    status_ = Status::Complete;
  }
  return status_;
}

GameOutcome GameRunner::outcome() const {
  if (status_ != Status::Complete) {
    throw shutbox::InvariantViolation("GameRunner::outcome requested while the game is in progress");
  }
  GameOutcome out;
  out.final_board = board_;
  out.rounds = rounds_;
  out.score = board_.score();
  out.tiles_closed = board_.tiles_closed();
  out.rolls = rolls_;
  out.moves = moves_;
  out.trace = trace_;
  out.final_roll = final_roll_;
  return out;
}

} // namespace shutbox_sim
