#include "shutbox_sim/result_writer.hpp"
#include "shutbox_sim/errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace shutbox_sim {

namespace {

template <typename T, typename Fn>
void write_int_array(std::ostream& oss, const std::vector<T>& items, Fn value) {
  oss << "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) oss << ",";
    oss << value(items[i]);
  }
  oss << "]";
}

void write_tiles(std::ostream& oss, const std::vector<int>& tiles) {
  write_int_array(oss, tiles, [](int t) { return t; });
}

void write_roll(std::ostream& oss, const shutbox::Roll& r) {
  oss << "[" << r.d1 << "," << r.d2 << "]";
}

void write_trace(std::ostream& oss, const GameOutcome& g) {
  oss << "{\"rounds\":[";
  for (size_t i = 0; i < g.trace.size(); ++i) {
    const RoundTrace& rt = g.trace[i];
    if (i > 0) oss << ",";
    oss << "{\"board\":";
    write_tiles(oss, rt.board_before.open_tiles());
    oss << ",\"roll\":";
    write_roll(oss, rt.roll);
    oss << ",\"move\":";
    write_tiles(oss, rt.move.tiles());
    oss << "}";
  }
  oss << "],\"final_roll\":";
  if (g.final_roll) {
    write_roll(oss, *g.final_roll);
  } else {
    oss << "null";
  }
  oss << "}";
}

// Writes content to path via path.tmp + rename.
void write_atomically(const std::string& path, const std::string& content) {
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw PersistenceError("cannot create directory " + target.parent_path().string() + ": " +
                             ec.message());
    }
  }

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw PersistenceError("cannot open " + tmp_path + " for writing");
    }
    out << content;
    out.flush();
    if (!out) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw PersistenceError("write to " + tmp_path + " failed");
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw PersistenceError("cannot move " + tmp_path + " to " + path + ": " + ec.message());
  }
}

std::string join_rolls(const GameOutcome& g) {
  std::ostringstream oss;
  for (size_t i = 0; i < g.rolls.size(); ++i) {
    if (i > 0) oss << ";";
    oss << "(" << g.rolls[i].d1 << " " << g.rolls[i].d2 << ")";
  }
  return oss.str();
}

std::string join_moves(const GameOutcome& g) {
  std::ostringstream oss;
  for (size_t i = 0; i < g.moves.size(); ++i) {
    if (i > 0) oss << ";";
    const auto tiles = g.moves[i].tiles();
    for (size_t j = 0; j < tiles.size(); ++j) {
      if (j > 0) oss << " ";
      oss << tiles[j];
    }
  }
  return oss.str();
}

} // namespace

std::string ResultWriter::to_json(const BatchResult& result) {
  std::ostringstream oss;
  oss << "{\n";
  oss << "  \"format_version\": 1,\n";
  oss << "  \"seed\": " << result.seed << ",\n";
  oss << "  \"records\": [";

  for (size_t r = 0; r < result.records.size(); ++r) {
    const SimulationRecord& rec = result.records[r];
    oss << (r > 0 ? ",\n" : "\n");
    oss << "    {\n";
    oss << "      \"strategy_id\": " << shutbox_ai::to_int(rec.strategy) << ",\n";
    oss << "      \"strategy_name\": \"" << shutbox_ai::strategy_name(rec.strategy) << "\",\n";
    oss << "      \"num_games\": " << rec.num_games() << ",\n";
    oss << "      \"seed\": " << rec.seed << ",\n";

    oss << "      \"scores\": ";
    write_int_array(oss, rec.games, [](const GameOutcome& g) { return g.score; });
    oss << ",\n      \"round_counts\": ";
    write_int_array(oss, rec.games, [](const GameOutcome& g) { return g.rounds; });
    oss << ",\n      \"tiles_closed\": ";
    write_int_array(oss, rec.games, [](const GameOutcome& g) { return g.tiles_closed; });

    if (result.traces) {
      oss << ",\n      \"traces\": [";
      for (size_t i = 0; i < rec.games.size(); ++i) {
        oss << (i > 0 ? ",\n        " : "\n        ");
        write_trace(oss, rec.games[i]);
      }
      oss << (rec.games.empty() ? "]" : "\n      ]");
    }
    oss << "\n    }";
  }

  oss << (result.records.empty() ? "]\n" : "\n  ]\n");
  oss << "}\n";
  return oss.str();
}

std::string ResultWriter::to_csv(const BatchResult& result) {
  std::ostringstream oss;
  oss << "Strategy,Game Number,Score,Tiles Closed,Rounds,Rolls,Moves\n";
  for (const SimulationRecord& rec : result.records) {
    for (size_t i = 0; i < rec.games.size(); ++i) {
      const GameOutcome& g = rec.games[i];
      oss << shutbox_ai::to_int(rec.strategy) << "," << (i + 1) << "," << g.score << ","
          << g.tiles_closed << "," << g.rounds << "," << join_rolls(g) << "," << join_moves(g)
          << "\n";
    }
  }
  return oss.str();
}

void ResultWriter::write_json(const BatchResult& result, const std::string& path) {
  write_atomically(path, to_json(result));
}

void ResultWriter::write_csv(const BatchResult& result, const std::string& path) {
  write_atomically(path, to_csv(result));
}

} // namespace shutbox_sim
