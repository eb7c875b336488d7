#pragma once
#include "shutbox_sim/game_outcome.hpp"
#include <string>

namespace shutbox_sim {

// Replays a traced game from a fresh board. Checks that every round starts
// from the recorded position, that every move is in the legal set of its
// board and roll, that the final roll (if any) has no legal move, and that
// the recorded final board, rounds and score match. On failure returns false
// and, if error is non-null, describes the first mismatch.
bool verify_trace(const GameOutcome& outcome, std::string* error = nullptr);

} // namespace shutbox_sim
