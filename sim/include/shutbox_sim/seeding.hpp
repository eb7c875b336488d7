#pragma once
#include "shutbox_ai/strategy_id.hpp"
#include <cstdint>

namespace shutbox_sim {

inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

// Seed of game `game_index` for `strategy` in a batch started from `base_seed`.
inline std::uint64_t derive_game_seed(std::uint64_t base_seed, shutbox_ai::StrategyId strategy,
                                      int game_index) {
  std::uint64_t h = splitmix64(base_seed);
  h = splitmix64(h ^ static_cast<std::uint64_t>(shutbox_ai::to_int(strategy) + 1));
  h = splitmix64(h ^ static_cast<std::uint64_t>(game_index));
  return h;
}

// Separate stream for the policy so its draws never shift the dice.
inline std::uint64_t derive_policy_seed(std::uint64_t game_seed) {
  return splitmix64(game_seed ^ 0xD1B54A32D192ED03ULL);
}

} // namespace shutbox_sim
