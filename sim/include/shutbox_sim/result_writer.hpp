#pragma once
#include "shutbox_sim/game_outcome.hpp"
#include <string>

namespace shutbox_sim {

/**
 * Serializes a BatchResult.
 *
 * JSON layout (format_version 1):
 *   {
 *     "format_version": 1,
 *     "seed": <base seed>,
 *     "records": [
 *       {
 *         "strategy_id": 3, "strategy_name": "SmartGuesser",
 *         "num_games": N, "seed": <base seed>,
 *         "scores": [...], "round_counts": [...], "tiles_closed": [...],
 *         "traces": [ {"rounds": [{"board": [...], "roll": [d1,d2], "move": [...]}],
 *                      "final_roll": [d1,d2] | null}, ... ]      (only with traces)
 *       }
 *     ]
 *   }
 *
 * The text depends only on the result, so equal batches give equal bytes.
 *
 * write_json/write_csv go through "<path>.tmp" and a rename, so an existing
 * file is either replaced whole or left alone. Failures throw PersistenceError.
 */
class ResultWriter {
public:
  static std::string to_json(const BatchResult& result);
  static std::string to_csv(const BatchResult& result);

  static void write_json(const BatchResult& result, const std::string& path);
  static void write_csv(const BatchResult& result, const std::string& path);
};

} // namespace shutbox_sim
