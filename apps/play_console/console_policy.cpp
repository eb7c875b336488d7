#include "console_policy.hpp"
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace shutbox_console {

ConsolePolicy::ConsolePolicy(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::optional<shutbox::Move> ConsolePolicy::parse_choice(const std::string& line,
                                                         const shutbox::MoveList& moves) {
  std::string body = line;
  bool tile_mode = false;
  const size_t first = body.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::nullopt;
  }
  if (body[first] == 't' || body[first] == 'T') {
    tile_mode = true;
    body = body.substr(first + 1);
  }
  for (char& c : body) {
    if (c == ',') c = ' ';
  }

  std::istringstream ss(body);
  std::vector<int> numbers;
  int n = 0;
  while (ss >> n) {
    numbers.push_back(n);
  }
  if (!ss.eof() || numbers.empty()) {
    return std::nullopt;  // stray characters or nothing numeric
  }

  if (!tile_mode && numbers.size() == 1) {
    const int index = numbers[0];
    if (index < 1 || index > static_cast<int>(moves.size)) {
      return std::nullopt;
    }
    return moves[static_cast<size_t>(index - 1)];
  }

  shutbox::Move m;
  try {
    m = shutbox::Move::from_tiles(numbers);
  } catch (const shutbox::InvariantViolation&) {
    return std::nullopt;
  }
  if (!moves.contains(m)) {
    return std::nullopt;
  }
  return m;
}

shutbox::Move ConsolePolicy::choose(const shutbox::Board& board, const shutbox::Roll& roll,
                                    const shutbox::MoveList& moves) {
  out_ << "\nBoard: " << board.to_string() << "  (score " << board.score() << ")\n";
  out_ << "Roll:  " << roll.d1 << " + " << roll.d2 << " = " << roll.target() << "\n";
  out_ << "Legal moves:\n";
  for (size_t i = 0; i < moves.size; ++i) {
    out_ << "  " << (i + 1) << ") " << moves[i].to_string() << "\n";
  }

  std::string line;
  while (true) {
    out_ << "Choose a move (index, or tiles e.g. 't 1 6'): " << std::flush;
    if (!std::getline(in_, line)) {
      throw std::runtime_error("input closed before a move was chosen");
    }
    std::optional<shutbox::Move> choice = parse_choice(line, moves);
    if (choice) {
      return *choice;
    }
    out_ << "Not a legal move: '" << line << "'\n";
  }
}

} // namespace shutbox_console
