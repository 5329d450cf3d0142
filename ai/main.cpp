#include "sweeper/board.hpp"
#include "sweeper/game_state.hpp"
#include "sweeper/knowledge_base.hpp"
#include "logic_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace sweeper;
using namespace sweeper_ai;

struct RunConfig {
    int num_games = 100;
    int height = DEFAULT_HEIGHT;
    int width = DEFAULT_WIDTH;
    int mines = DEFAULT_MINES;
    uint32_t seed = 0;
    bool seeded = false;
    bool verbose = false;
};

struct GameResult {
    Outcome outcome = Outcome::Ongoing;
    int moves = 0;
    int safe_moves = 0;
};

void print_view(const GameState& game, const KnowledgeBase& kb) {
    const Board& board = game.board();
    for (int r = 0; r < board.height(); ++r) {
        std::cout << "  ";
        for (int c = 0; c < board.width(); ++c) {
            const Cell cell{r, c};
            if (game.revealed().count(cell)) {
                std::cout << board.nearby_mine_count(cell) << ' ';
            } else if (kb.mines().count(cell)) {
                std::cout << "F ";
            } else if (kb.safes().count(cell)) {
                std::cout << "s ";
            } else {
                std::cout << ". ";
            }
        }
        std::cout << "\n";
    }
}

GameResult play_game(const RunConfig& cfg, std::mt19937& board_rng, LogicPolicy& policy, bool verbose) {
    GameState game(Board(cfg.height, cfg.width, cfg.mines, board_rng));
    KnowledgeBase kb(cfg.height, cfg.width);
    if (cfg.verbose) kb.set_verbose(true);
    GameResult result;

    if (verbose) {
        std::cout << "\n========== Game Start ==========\n";
        game.board().print(std::cout);
    }

    while (!game.finished()) {
        const Pick pick = policy.pick(kb);
        if (!pick.cell) {
            if (verbose) std::cout << "\nNo moves left to make\n";
            break;
        }

        const Cell move = *pick.cell;
        ++result.moves;
        if (pick.kind == MoveKind::Safe) ++result.safe_moves;
        if (verbose) {
            std::cout << "\nMove " << result.moves << ": " << move
                      << (pick.kind == MoveKind::Safe ? " (safe)" : " (guess)") << "\n";
        }

        const auto count = game.reveal(move);
        if (!count) break;
        kb.add_knowledge(move, *count);
        game.check_flags(kb.mines());

        if (verbose) print_view(game, kb);
    }

    result.outcome = game.outcome();
    if (verbose) {
        std::cout << "\n*** Game " << to_string(result.outcome) << " after "
                  << result.moves << " moves ***\n";
    }
    return result;
}

void run_series(const RunConfig& cfg) {
    std::mt19937 board_rng(cfg.seed);
    LogicPolicy policy = cfg.seeded ? LogicPolicy(cfg.seed ^ 0x9e3779b9u) : LogicPolicy();

    int wins = 0;
    int losses = 0;
    int stalls = 0;
    int total_moves = 0;
    int total_safe = 0;

    std::cout << "\n======================================\n";
    std::cout << "Board: " << cfg.height << "x" << cfg.width << " with " << cfg.mines << " mines\n";
    std::cout << "Number of games: " << cfg.num_games << "\n";
    std::cout << "======================================\n";

    for (int i = 0; i < cfg.num_games; ++i) {
        const GameResult r = play_game(cfg, board_rng, policy, i == 0);
        if (r.outcome == Outcome::Won) {
            ++wins;
        } else if (r.outcome == Outcome::Lost) {
            ++losses;
        } else {
            ++stalls;
        }
        total_moves += r.moves;
        total_safe += r.safe_moves;
    }

    std::cout << "\n======================================\n";
    std::cout << "Results after " << cfg.num_games << " games:\n";
    std::cout << "  Wins: " << wins << " (" << (100.0 * wins / cfg.num_games) << "%)\n";
    std::cout << "  Losses: " << losses << " (" << (100.0 * losses / cfg.num_games) << "%)\n";
    std::cout << "  Stalled: " << stalls << "\n";
    std::cout << "  Average moves: " << static_cast<double>(total_moves) / cfg.num_games << "\n";
    if (total_moves > 0) {
        std::cout << "  Safe moves: " << (100.0 * total_safe / total_moves) << "%\n";
    }
    std::cout << "======================================\n";
}

bool is_number_string(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

int parse_int(std::string_view name, std::string_view text) {
    if (!is_number_string(text)) {
        throw std::invalid_argument("Expected a non-negative number for " + std::string(name) +
                                    ", got '" + std::string(text) + "'");
    }
    return std::stoi(std::string(text));
}

RunConfig parse_args(int argc, char** argv) {
    RunConfig cfg;

    if (const char* env = std::getenv("SWEEPER_SEED")) {
        cfg.seed = static_cast<uint32_t>(parse_int("SWEEPER_SEED", env));
        cfg.seeded = true;
    }

    int arg_index = 1;
    if (arg_index < argc && is_number_string(argv[arg_index])) {
        cfg.num_games = std::max(1, std::atoi(argv[arg_index]));
        ++arg_index;
    }

    for (; arg_index < argc; ++arg_index) {
        std::string_view arg = argv[arg_index];
        if (arg.rfind("--games=", 0) == 0) {
            cfg.num_games = std::max(1, parse_int("--games", arg.substr(8)));
        } else if (arg.rfind("--height=", 0) == 0) {
            cfg.height = parse_int("--height", arg.substr(9));
        } else if (arg.rfind("--width=", 0) == 0) {
            cfg.width = parse_int("--width", arg.substr(8));
        } else if (arg.rfind("--mines=", 0) == 0) {
            cfg.mines = parse_int("--mines", arg.substr(8));
        } else if (arg.rfind("--seed=", 0) == 0) {
            cfg.seed = static_cast<uint32_t>(parse_int("--seed", arg.substr(7)));
            cfg.seeded = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
        }
    }

    if (!cfg.seeded) {
        cfg.seed = std::random_device{}();
    }
    return cfg;
}

int main(int argc, char** argv) {
    try {
        const RunConfig cfg = parse_args(argc, argv);
        std::cerr << "[SelfPlay] seed=" << cfg.seed << std::endl;
        run_series(cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
