#include "shutbox_sim/replay.hpp"
#include "shutbox/move_list.hpp"
#include "shutbox/rules.hpp"

namespace shutbox_sim {

namespace {

bool fail(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

} // namespace

bool verify_trace(const GameOutcome& outcome, std::string* error) {
  shutbox::Board board;
  shutbox::MoveList moves;

  for (size_t i = 0; i < outcome.trace.size(); ++i) {
    const RoundTrace& rt = outcome.trace[i];
    const std::string where = "round " + std::to_string(i + 1);

    if (rt.board_before != board) {
      return fail(error, where + ": recorded board " + rt.board_before.to_string() +
                             " but replay has " + board.to_string());
    }
    shutbox::Rules::legal_moves(board, rt.roll, moves);
    if (!moves.contains(rt.move)) {
      return fail(error, where + ": move " + rt.move.to_string() + " is not legal on " +
                             board.to_string() + " for total " + std::to_string(rt.roll.target()));
    }
    board.shut(rt.move);
  }

  if (outcome.final_roll) {
    if (board.is_fully_shut()) {
      return fail(error, "final roll recorded after the box was shut");
    }
    shutbox::Rules::legal_moves(board, *outcome.final_roll, moves);
    if (!moves.empty()) {
      return fail(error, "final roll total " + std::to_string(outcome.final_roll->target()) +
                             " still has a legal move on " + board.to_string());
    }
  } else if (!board.is_fully_shut()) {
    return fail(error, "game stops on " + board.to_string() + " without a final roll");
  }

  if (board != outcome.final_board) {
    return fail(error, "replayed board " + board.to_string() + " differs from recorded " +
                           outcome.final_board.to_string());
  }
  if (outcome.rounds != static_cast<int>(outcome.trace.size())) {
    return fail(error, "round count " + std::to_string(outcome.rounds) + " but " +
                           std::to_string(outcome.trace.size()) + " traced rounds");
  }
  if (outcome.score != board.score()) {
    return fail(error, "score " + std::to_string(outcome.score) + " but open tiles sum to " +
                           std::to_string(board.score()));
  }
  return true;
}

} // namespace shutbox_sim
