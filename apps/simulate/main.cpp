#include "shutbox_ai/strategy_id.hpp"
#include "shutbox_sim/errors.hpp"
#include "shutbox_sim/simulation_config.hpp"
#include "shutbox_sim/simulation_harness.hpp"
#include "shutbox_sim/stop_signal.hpp"
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using namespace shutbox_sim;

namespace {

std::vector<int> parse_strategy_list(const std::string& text) {
    std::vector<int> ids;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            throw std::invalid_argument("empty entry in strategy list '" + text + "'");
        }
        size_t pos = 0;
        int id = std::stoi(item, &pos);
        if (pos != item.size()) {
            throw std::invalid_argument("bad strategy id '" + item + "'");
        }
        ids.push_back(id);
    }
    return ids;
}

std::uint64_t parse_seed(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw std::invalid_argument("seed must be a non-negative integer, got '" + text + "'");
    }
    size_t pos = 0;
    unsigned long long seed = std::stoull(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("seed must be a non-negative integer, got '" + text + "'");
    }
    return static_cast<std::uint64_t>(seed);
}

int parse_int(const std::string& flag, const std::string& text) {
    size_t pos = 0;
    int value = std::stoi(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument(flag + " expects an integer, got '" + text + "'");
    }
    return value;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --games N          Games per strategy (default: 1000)\n";
    std::cout << "  --strategies LIST  Comma-separated strategy ids (default: 0,1,2,3,4,5)\n";
    std::cout << "                     0=Random 1=SingleSeeker 2=BigBlocker 3=SmartGuesser\n";
    std::cout << "                     4=InsideOut 5=OutsideIn\n";
    std::cout << "  --seed S           Base seed (default: 0)\n";
    std::cout << "  --threads N        Worker threads (default: 4)\n";
    std::cout << "  --output PATH      JSON result file (default: stb_results.json)\n";
    std::cout << "  --csv PATH         Also write a CSV file\n";
    std::cout << "  --traces           Record round-by-round traces\n";
    std::cout << "  --progress N       Progress line every N games per strategy\n";
    std::cout << "  --quiet            No progress output\n";
    std::cout << "  --help             Show this help message\n";
}

void print_summary(const BatchResult& result, double seconds) {
    std::cout << "\n=== Batch Summary ===\n";
    long long total_games = 0;
    for (const auto& record : result.records) {
        long long score_sum = 0;
        long long closed_sum = 0;
        int perfect = 0;
        for (const auto& g : record.games) {
            score_sum += g.score;
            closed_sum += g.tiles_closed;
            if (g.score == 0) perfect++;
        }
        const int n = record.num_games();
        total_games += n;
        std::cout << "Strategy " << shutbox_ai::to_int(record.strategy) << " ("
                  << shutbox_ai::strategy_name(record.strategy) << " - "
                  << shutbox_ai::strategy_description(record.strategy) << "):\n";
        std::cout << "  Games Simulated: " << n << "\n";
        std::cout << "  Average Score: " << std::fixed << std::setprecision(2)
                  << static_cast<double>(score_sum) / n << "\n";
        std::cout << "  Average Tiles Closed: " << std::setprecision(1)
                  << static_cast<double>(closed_sum) / n << "\n";
        std::cout << "  Perfect Games: " << perfect << "\n";
    }
    std::cout << "Total: " << total_games << " games in " << std::setprecision(1) << seconds
              << " seconds (" << (total_games / (seconds > 0.0 ? seconds : 1.0)) << " games/second)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    SimulationConfig config;
    config.verbose = true;
    config.progress_interval = 100;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--games" && i + 1 < argc) {
                config.num_games = parse_int(arg, argv[++i]);
            } else if (arg == "--strategies" && i + 1 < argc) {
                config.strategies = parse_strategy_list(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                config.seed = parse_seed(argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                config.num_threads = parse_int(arg, argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                config.output_path = argv[++i];
            } else if (arg == "--csv" && i + 1 < argc) {
                config.csv_path = argv[++i];
            } else if (arg == "--traces") {
                config.record_traces = true;
            } else if (arg == "--progress" && i + 1 < argc) {
                config.progress_interval = parse_int(arg, argv[++i]);
            } else if (arg == "--quiet") {
                config.verbose = false;
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: Unknown or incomplete option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    try {
        SimulationHarness harness(config);

        double seconds = 0.0;
        {
            // Ctrl-C stops the batch; released on every exit from this block
            StopSignalGuard sigint(harness);
            auto start = std::chrono::steady_clock::now();
            harness.simulate();
            seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        }

        try {
            harness.persist();
        } catch (const PersistenceError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            // One retry beside the working directory so the batch is not lost
            const std::string fallback = "stb_results_recovered.json";
            std::cerr << "Retrying with " << fallback << "\n";
            harness.persist(fallback);
        }

        print_summary(harness.results(), seconds);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const SimulationError& e) {
        std::cerr << "Simulation failed: " << e.what() << "\n";
        return 1;
    } catch (const PersistenceError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::system_error& e) {
        std::cerr << "Error: cannot start worker threads: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
