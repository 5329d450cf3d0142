#include <cassert>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include "sweeper/board.hpp"
#include "sweeper/game_state.hpp"

using namespace sweeper;

void test_nearby_mine_count() {
    std::cout << "Testing nearby_mine_count...\n";

    Board board(3, 3, CellSet{{2, 2}});
    assert(board.mine_count() == 1);
    assert(board.is_mine({2, 2}));
    assert(!board.is_mine({1, 1}));
    assert(board.nearby_mine_count({0, 0}) == 0);
    assert(board.nearby_mine_count({1, 1}) == 1);
    assert(board.nearby_mine_count({2, 1}) == 1);
    assert(board.nearby_mine_count({1, 2}) == 1);
    assert(board.nearby_mine_count({0, 2}) == 0);
    // the cell itself does not count
    assert(board.nearby_mine_count({2, 2}) == 0);

    Board crowded(3, 3, CellSet{{0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 2}, {2, 0}, {2, 1}, {2, 2}});
    assert(crowded.nearby_mine_count({1, 1}) == 8);
    assert(crowded.nearby_mine_count({0, 0}) == 2);

    std::cout << "PASSED: test_nearby_mine_count\n";
}

void test_neighbors() {
    std::cout << "Testing neighbors...\n";

    Board board(3, 4, CellSet{});
    assert(board.neighbors({0, 0}).size() == 3);
    assert(board.neighbors({0, 1}).size() == 5);
    assert(board.neighbors({1, 1}).size() == 8);
    assert(board.neighbors({2, 3}).size() == 3);
    for (const Cell& n : board.neighbors({1, 1})) {
        assert(n != (Cell{1, 1}));
        assert(board.in_bounds(n));
    }

    std::cout << "PASSED: test_neighbors\n";
}

void test_random_placement() {
    std::cout << "Testing random mine placement...\n";

    std::mt19937 rng_a(42);
    std::mt19937 rng_b(42);
    Board a(8, 8, 10, rng_a);
    Board b(8, 8, 10, rng_b);
    assert(a.mine_count() == 10);
    assert(a.mines() == b.mines());
    for (const Cell& m : a.mines()) {
        assert(a.in_bounds(m));
        assert(a.is_mine(m));
    }

    std::mt19937 rng_full(7);
    Board full(2, 3, 6, rng_full);
    assert(full.mine_count() == 6);

    std::cout << "PASSED: test_random_placement\n";
}

void test_invalid_boards() {
    std::cout << "Testing invalid construction...\n";

    std::mt19937 rng(1);
    int failures = 0;
    try { Board b(0, 3, 1, rng); } catch (const std::invalid_argument&) { ++failures; }
    try { Board b(3, -1, 1, rng); } catch (const std::invalid_argument&) { ++failures; }
    try { Board b(2, 2, 5, rng); } catch (const std::invalid_argument&) { ++failures; }
    try { Board b(2, 2, -1, rng); } catch (const std::invalid_argument&) { ++failures; }
    try { Board b(2, 2, CellSet{{2, 0}}); } catch (const std::invalid_argument&) { ++failures; }
    assert(failures == 5);

    Board board(2, 2, CellSet{{0, 0}});
    bool threw = false;
    try {
        board.nearby_mine_count({2, 2});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED: test_invalid_boards\n";
}

void test_won() {
    std::cout << "Testing won...\n";

    Board board(3, 3, CellSet{{0, 1}, {2, 2}});
    assert(!board.won({}));
    assert(!board.won({{0, 1}}));
    assert(!board.won({{0, 1}, {2, 2}, {1, 1}}));
    assert(board.won({{2, 2}, {0, 1}}));

    std::cout << "PASSED: test_won\n";
}

void test_print() {
    std::cout << "Testing print...\n";

    Board board(2, 2, CellSet{{0, 0}, {1, 1}});
    std::ostringstream oss;
    board.print(oss);
    std::cout << oss.str();
    assert(oss.str() == "-----\n|X| |\n-----\n| |X|\n-----\n");

    std::cout << "PASSED: test_print\n";
}

void test_game_state() {
    std::cout << "Testing GameState...\n";

    GameState game(Board(2, 2, CellSet{{1, 1}}));
    assert(game.outcome() == Outcome::Ongoing);

    auto count = game.reveal({0, 0});
    assert(count && *count == 1);
    assert(!game.finished());
    game.reveal({0, 1});
    game.reveal({1, 0});
    assert(game.outcome() == Outcome::Won);

    bool threw = false;
    try {
        game.reveal({1, 1});
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    GameState lost(Board(2, 2, CellSet{{1, 1}}));
    const auto boom = lost.reveal({1, 1});
    assert(!boom);
    assert(lost.outcome() == Outcome::Lost);
    assert(std::string(to_string(lost.outcome())) == "lost");

    GameState flagged(Board(2, 2, CellSet{{1, 1}}));
    assert(!flagged.check_flags({{0, 0}}));
    assert(flagged.check_flags({{1, 1}}));
    assert(flagged.outcome() == Outcome::Won);

    std::cout << "PASSED: test_game_state\n";
}

int main() {
    std::cout << "=== Board Test ===" << std::endl;
    test_nearby_mine_count();
    test_neighbors();
    test_random_placement();
    test_invalid_boards();
    test_won();
    test_print();
    test_game_state();
    std::cout << "\n=== All tests passed ===" << std::endl;
    return 0;
}
