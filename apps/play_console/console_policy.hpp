#pragma once
#include "shutbox/board.hpp"
#include "shutbox/dice.hpp"
#include "shutbox/move.hpp"
#include "shutbox/move_list.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace shutbox_console {

/**
 * Human player for GameRunner.
 *
 * Prints the position, the roll and the numbered legal moves, then reads a
 * line. One number picks a move by its 1-based index; several numbers, or a
 * line starting with 't', name the tiles to shut. Bad input re-prompts.
 * Throws std::runtime_error when input runs out.
 */
class ConsolePolicy {
public:
  ConsolePolicy(std::istream& in, std::ostream& out);

  shutbox::Move choose(const shutbox::Board& board, const shutbox::Roll& roll,
                       const shutbox::MoveList& moves);

  // Parses one input line against the legal set. Empty when the line does
  // not name a legal move.
  static std::optional<shutbox::Move> parse_choice(const std::string& line,
                                                   const shutbox::MoveList& moves);

private:
  std::istream& in_;
  std::ostream& out_;
};

} // namespace shutbox_console
