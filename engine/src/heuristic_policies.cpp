#include "shutbox_ai/heuristic_policies.hpp"
#include "shutbox/rules.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace shutbox_ai {

using shutbox::Board;
using shutbox::Move;
using shutbox::MoveList;
using shutbox::Roll;

namespace {

void require_moves(const MoveList& moves, const char* who) {
  if (moves.empty()) {
    throw shutbox::InvariantViolation(std::string(who) + "::choose called without legal moves");
  }
}

// Best move under a strict total order `better`.
template <typename Better>
Move pick_best(const MoveList& moves, Better better) {
  const Move* best = &moves[0];
  for (std::size_t i = 1; i < moves.size; ++i) {
    if (better(moves[i], *best)) best = &moves[i];
  }
  return *best;
}

bool lex_less(const Move& a, const Move& b) {
  return shutbox::compare_tiles(a, b) < 0;
}

Move lex_smallest(const MoveList& moves) {
  return pick_best(moves, lex_less);
}

// Lower key wins; ties go to fewer tiles, then the smaller tile sequence.
template <typename Key>
Move pick_by_distance(const MoveList& moves, Key key) {
  return pick_best(moves, [&](const Move& a, const Move& b) {
    const int ka = key(a);
    const int kb = key(b);
    if (ka != kb) return ka < kb;
    if (a.size() != b.size()) return a.size() < b.size();
    return lex_less(a, b);
  });
}

} // namespace

Move SingleSeekerPolicy::choose(const Board& /*b*/, const Roll& r, const MoveList& moves) const {
  require_moves(moves, "SingleSeekerPolicy");

  const int total = r.target();
  if (shutbox::is_valid_tile(total)) {
    const Move single(shutbox::tile_bit(total));
    if (moves.contains(single)) return single;
  }

  // Both faces as separate tiles; a double cannot be split this way
  if (r.d1 != r.d2) {
    const Move faces(static_cast<std::uint16_t>(shutbox::tile_bit(r.d1) | shutbox::tile_bit(r.d2)));
    if (moves.contains(faces)) return faces;
  }

  return lex_smallest(moves);
}

Move BigBlockerPolicy::choose(const Board& /*b*/, const Roll& /*r*/, const MoveList& moves) const {
  require_moves(moves, "BigBlockerPolicy");
  return pick_best(moves, [](const Move& a, const Move& b) {
    if (a.size() != b.size()) return a.size() > b.size();
    return lex_less(a, b);
  });
}

int SmartGuesserPolicy::remaining_coverage(const Board& b, const Move& m) {
  const std::uint16_t remaining = static_cast<std::uint16_t>(b.open_mask() & ~m.mask);
  return shutbox::Rules::reachable_targets(remaining);
}

Move SmartGuesserPolicy::choose(const Board& b, const Roll& /*r*/, const MoveList& moves) const {
  require_moves(moves, "SmartGuesserPolicy");

  int coverage[MoveList::kCapacity];
  for (std::size_t i = 0; i < moves.size; ++i) {
    coverage[i] = remaining_coverage(b, moves[i]);
  }

  std::size_t best = 0;
  for (std::size_t i = 1; i < moves.size; ++i) {
    if (coverage[i] > coverage[best] ||
        (coverage[i] == coverage[best] && lex_less(moves[i], moves[best]))) {
      best = i;
    }
  }
  return moves[best];
}

int InsideOutPolicy::center_distance(const Move& m) {
  constexpr int kCenter = (shutbox::kMinTile + shutbox::kMaxTile) / 2;
  int d = 0;
  for (int t : m.tiles()) d += std::abs(t - kCenter);
  return d;
}

Move InsideOutPolicy::choose(const Board& /*b*/, const Roll& /*r*/, const MoveList& moves) const {
  require_moves(moves, "InsideOutPolicy");
  return pick_by_distance(moves, center_distance);
}

int OutsideInPolicy::edge_distance(const Move& m) {
  int d = 0;
  for (int t : m.tiles()) d += std::min(t - shutbox::kMinTile, shutbox::kMaxTile - t);
  return d;
}

Move OutsideInPolicy::choose(const Board& /*b*/, const Roll& /*r*/, const MoveList& moves) const {
  require_moves(moves, "OutsideInPolicy");
  return pick_by_distance(moves, edge_distance);
}

} // namespace shutbox_ai
