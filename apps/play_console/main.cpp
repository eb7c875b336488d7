#include "console_policy.hpp"
#include "shutbox/dice.hpp"
#include "shutbox_sim/game_runner.hpp"
#include <cctype>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

using namespace shutbox;
using namespace shutbox_sim;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --seed S    Dice seed (default: random)\n";
    std::cout << "  --help      Show this help message\n";
}

int main(int argc, char* argv[]) {
    std::uint64_t seed = std::random_device{}();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--seed" && i + 1 < argc) {
            std::string text = argv[++i];
            try {
                size_t pos = 0;
                if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
                    throw std::invalid_argument(text);
                }
                seed = std::stoull(text, &pos);
                if (pos != text.size()) {
                    throw std::invalid_argument(text);
                }
            } catch (const std::exception&) {
                std::cerr << "Error: seed must be a non-negative integer, got '" << text << "'\n";
                return 1;
            }
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::cout << "=== Shut the Box ===\n";
    std::cout << "Seed: " << seed << "\n";

    std::mt19937_64 rng(seed);
    DiceRoller dice(rng);
    shutbox_console::ConsolePolicy player(std::cin, std::cout);
    GameRunner runner(dice, true);

    GameOutcome outcome;
    try {
        outcome = runner.play_to_end(player);
    } catch (const std::runtime_error& e) {
        std::cerr << "\nGame abandoned: " << e.what() << "\n";
        return 1;
    }

    if (outcome.final_roll) {
        std::cout << "\nRolled " << outcome.final_roll->d1 << " + " << outcome.final_roll->d2
                  << " = " << outcome.final_roll->target() << " - no legal move.\n";
    }
    std::cout << "Final board: " << outcome.final_board.to_string() << "\n";
    std::cout << "Rounds: " << outcome.rounds << " | Tiles closed: " << outcome.tiles_closed
              << " | Score: " << outcome.score << "\n";
    if (outcome.score == 0) {
        std::cout << "You shut the box!\n";
    }
    return 0;
}
